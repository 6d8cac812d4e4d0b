#pragma once

#include "av/watch/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace av::watch {

/**
 * @brief Builds the variant matchers for the base filenames of a folder
 *
 * For every BaseFileSpec, five patterns are produced in fixed precedence
 * (numbered-prefix, copy-suffix, parenthesized-counter, separator-digits,
 * catch-all). Specs keep their configuration order, so on overlapping names
 * the first configured spec wins.
 *
 * All patterns are anchored to the whole filename and case-sensitive.
 */
class PatternCompiler {
public:
    /**
     * @brief Compile all patterns for a folder's base filename list
     */
    static std::vector<VariantPattern> compile(const std::vector<BaseFileSpec>& specs);

    /**
     * @brief Compile the five patterns of a single base filename
     */
    static std::vector<VariantPattern> compile(const BaseFileSpec& spec);

    /**
     * @brief Split "report.final.pdf" into {"report.final", ".pdf"}
     *
     * Uses path stem/extension rules: ".bashrc" has no extension.
     */
    static std::pair<std::string, std::string> split_name(const std::string& filename);

    /**
     * @brief Escape ECMAScript regex metacharacters so text matches literally
     */
    static std::string escape(const std::string& text);
};

} // namespace av::watch
