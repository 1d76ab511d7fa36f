#include "args.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <records/record_source.hpp>

CliOptions parse_args(const std::vector<std::string>& args) {
    CliOptions opts;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();

        if (arg == "-d") {
            if (has_value) opts.display_attrs.push_back(args[++i]);
        } else if (arg == "-o") {
            if (has_value) opts.output_attr = args[++i];
        } else if (arg == "-s") {
            if (has_value) opts.separator = args[++i];
        } else if (arg == "-t") {
            opts.truncate = true;
        } else if (arg == "-T") {
            opts.table_mode = true;
        } else if (arg == "-l") {
            opts.line_mode = true;
        } else if (arg == "-a") {
            opts.all_attrs = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else if (arg.empty() || arg[0] != '-') {
            opts.filename = arg;
        }
        // other dash arguments are ignored
    }
    return opts;
}

Result<void> validate_options(const CliOptions& opts) {
    if (opts.all_attrs && !opts.display_attrs.empty())
        return Result<void>::Err("cannot use both -a and -d");

    if (opts.line_mode) {
        if (!opts.display_attrs.empty()) return Result<void>::Err("cannot use -d in line mode");
        if (opts.all_attrs)              return Result<void>::Err("cannot use -a in line mode");
        if (!opts.output_attr.empty())   return Result<void>::Err("cannot use -o in line mode");
        if (opts.separator)              return Result<void>::Err("cannot use -s in line mode");
        if (opts.truncate)               return Result<void>::Err("cannot use -t in line mode");
        if (opts.table_mode)             return Result<void>::Err("cannot use -T in line mode");
    }
    return Result<void>::Ok();
}

SessionPlan build_plan(const CliOptions& opts, const PickerSettings& settings,
                       const std::vector<Record>& records) {
    SessionPlan plan;

    // Line mode always shows and prints the raw line
    if (opts.line_mode) {
        plan.spec.fields = {LINE_MODE_FIELD};
        plan.output_attr = LINE_MODE_FIELD;
        return plan;
    }

    plan.spec.fields = opts.all_attrs ? all_attributes(records) : opts.display_attrs;
    plan.spec.separator = opts.separator ? *opts.separator : settings.separator;
    plan.spec.truncate = opts.truncate || settings.truncate;
    plan.spec.table_mode = opts.table_mode || settings.table_mode;
    plan.output_attr = opts.output_attr;
    return plan;
}

std::string usage_text() {
    std::string out;
    out += "Usage: jpick [filename] [-d display-attribute] [-o output-attribute] [-s separator] [-t] [-T] [-l] [-a]\n";
    out += "       jpick [-d display-attribute] [-o output-attribute] [-s separator] [-t] [-T] [-l] [-a] < input\n\n";
    out += "Input can be provided via stdin or filename, but not both.\n";
    out += "If no display-attribute is provided, the whole object is displayed.\n\n";
    out += theme::bold("Options:") + "\n";
    out += theme::kv("-d <attr>", "Display specific attribute in list (can be used multiple times)");
    out += theme::kv("-o <attr>", "Output specific attribute from selected object(s)");
    out += theme::kv("-s <sep>", "Separator for multiple display attributes (default: \" - \")");
    out += theme::kv("-t", "Truncate long lines instead of wrapping");
    out += theme::kv("-T", "Table mode: align attributes in columns");
    out += theme::kv("-l", "Line mode: treat input as plain text lines");
    out += theme::kv("-a", "Display all attributes (cannot be used with -d)");
    out += theme::kv("--version", "Show version");
    out += "\n" + theme::bold("Controls:") + "\n";
    out += theme::kv("Up/Down", "Navigate");
    out += theme::kv("Ctrl+Space", "Toggle selection (multi-select)");
    out += theme::kv("Enter", "Confirm selection");
    out += theme::kv("Esc/Ctrl+C", "Cancel");
    out += "\n" + theme::bold("Config:") + "\n";
    out += "  ~/.jpick/config.yaml (or $JPICK_CONFIG): separator, truncate, table, chrome_rows, log\n\n";
    out += theme::bold("Examples:") + "\n";
    out += "  jpick yourfile.json -d display_attribute -o output_attribute\n";
    out += "  jpick -d name -d id -T < data.json\n";
    out += "  cat file.txt | jpick -l\n";
    return out;
}
