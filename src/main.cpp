#include <iostream>
#include <vector>
#include <string>
#include <cstdlib>
#include <cli/args.hpp>
#include <cli/picker_session.hpp>
#include <cli/record_output.hpp>
#include <cli/theme.hpp>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <records/display_format.hpp>
#include <records/record_source.hpp>
#include <fmt/format.h>

static int fatal(const std::string& msg) {
    std::cerr << theme::fail(msg);
    return 1;
}

int main(int argc, char** argv) {
    try {
        CliOptions opts = parse_args(std::vector<std::string>(argv + 1, argv + argc));

        if (opts.help) {
            std::cerr << usage_text();
            return 0;
        }
        if (opts.version) {
            std::cout << theme::bold("jpick") << theme::dim(std::string(" version ") + JPICK_VERSION) << "\n";
            return 0;
        }

        auto valid = validate_options(opts);
        if (valid.is_err()) return fatal(valid.error);

        auto config = Config::load();
        if (config.is_err()) return fatal(config.error);
        const PickerSettings& settings = config.value.settings();

        const char* debug_env = std::getenv(DEBUG_ENV);
        set_log_enabled(settings.log || (debug_env && *debug_env));
        jpick_log(fmt::format("jpick {} starting, config {}", JPICK_VERSION, config.value.source().string()));

        auto input = read_input(opts.filename, !platform::stdin_is_tty(), std::cin);
        if (input.is_err()) {
            if (input.error == "no input provided") std::cerr << usage_text() << "\n";
            return fatal(input.error);
        }

        auto records = parse_records(input.value, opts.line_mode);
        if (records.is_err()) return fatal(records.error);

        SessionPlan plan = build_plan(opts, settings, records.value);
        DisplayFormatter formatter(plan.spec, records.value);

        auto tty = platform::Tty::open_controlling();
        if (tty.is_err()) return fatal(tty.error);

        PickerContext ctx;
        ctx.display_values = formatter.format_all(records.value);
        ctx.spec = plan.spec;
        ctx.geometry = platform::term_geometry(tty.value->fd());
        ctx.chrome_rows = settings.chrome_rows;

        PickerSession session(*tty.value, std::move(ctx));
        auto chosen = session.run();
        if (chosen.is_err()) return fatal(chosen.error);

        auto lines = format_selection(records.value, chosen.value, plan.output_attr);
        if (lines.is_err()) return fatal(lines.error);
        for (const auto& line : lines.value) std::cout << line << "\n";

        return 0;
    } catch (const std::exception& e) {
        return fatal(e.what());
    }
}
