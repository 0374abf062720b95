#include "commands/schema.hpp"

#include "schema/SchemaIO.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static std::string delimiter_label(char c) {
    if (c == '\t') return "\\t";
    return std::string(1, c);
}

int cmd_schema(int argc, char** argv) {
    const std::string schema_path = get_arg(argc, argv, "--schema", "");
    if (schema_path.empty()) {
        std::cerr << "error: missing --schema\n";
        std::cerr << "usage:\n  csvcheck schema --schema <json>\n";
        return 2;
    }

    csvcheck::SchemaFile sf;
    try {
        sf = csvcheck::load_schema_file(schema_path);
    } catch (const std::exception& e) {
        std::cerr << "[error] failed to load schema: " << e.what() << "\n";
        return 2;
    }

    std::cout << "[Schema] " << schema_path << " (" << sf.schema.size() << " columns)\n";
    if (sf.encoding)   std::cout << "  encoding: " << *sf.encoding << "\n";
    if (sf.delimiter)  std::cout << "  delimiter: " << delimiter_label(*sf.delimiter) << "\n";
    if (sf.max_errors) std::cout << "  max_errors: " << *sf.max_errors << "\n";

    for (const auto& [name, rule] : sf.schema.columns()) {
        std::cout << "  - " << name << ": " << csvcheck::column_type_name(rule.type)
                  << (rule.is_required() ? ", required" : ", nullable");
        if (!rule.validator_name.empty()) std::cout << ", validator=" << rule.validator_name;
        std::cout << "\n";
    }
    return 0;
}
