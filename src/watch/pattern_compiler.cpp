#include "av/watch/pattern_compiler.hpp"

#include <filesystem>

namespace av::watch {
namespace {

VariantPattern make_pattern(VariantKind kind, const std::string& base_filename, const std::string& body) {
    VariantPattern pattern;
    pattern.kind = kind;
    pattern.base_filename = base_filename;
    pattern.expression = std::regex("^" + body + "$", std::regex::ECMAScript);
    return pattern;
}

} // namespace

const char* to_string(VariantKind kind) {
    switch (kind) {
        case VariantKind::NumberedPrefix: return "numbered-prefix";
        case VariantKind::CopySuffix: return "copy-suffix";
        case VariantKind::ParenthesizedCounter: return "parenthesized-counter";
        case VariantKind::SeparatorDigits: return "separator-digits";
        case VariantKind::CatchAll: return "catch-all";
    }
    return "unknown";
}

std::vector<VariantPattern> PatternCompiler::compile(const std::vector<BaseFileSpec>& specs) {
    std::vector<VariantPattern> patterns;
    patterns.reserve(specs.size() * 5);
    for (const auto& spec : specs) {
        auto compiled = compile(spec);
        for (auto& pattern : compiled) {
            patterns.push_back(std::move(pattern));
        }
    }
    return patterns;
}

std::vector<VariantPattern> PatternCompiler::compile(const BaseFileSpec& spec) {
    const auto [name, ext] = split_name(spec.name);
    const std::string full = escape(spec.name);
    const std::string n = escape(name);
    const std::string e = escape(ext);

    std::vector<VariantPattern> patterns;
    patterns.reserve(5);
    patterns.push_back(make_pattern(VariantKind::NumberedPrefix, spec.name, R"(\(\d+\))" + full));
    patterns.push_back(make_pattern(VariantKind::CopySuffix, spec.name, n + R"([ _-]copy\d*)" + e));
    patterns.push_back(make_pattern(VariantKind::ParenthesizedCounter, spec.name, n + R"( \(\d+\))" + e));
    patterns.push_back(make_pattern(VariantKind::SeparatorDigits, spec.name, n + R"([ _-]\d+)" + e));
    patterns.push_back(make_pattern(VariantKind::CatchAll, spec.name, ".*" + n + ".*" + e));
    return patterns;
}

std::pair<std::string, std::string> PatternCompiler::split_name(const std::string& filename) {
    const std::filesystem::path path(filename);
    return {path.stem().string(), path.extension().string()};
}

std::string PatternCompiler::escape(const std::string& text) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (special.find(c) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

} // namespace av::watch
