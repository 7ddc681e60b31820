#include "tfgen/terraform_file.hpp"

#include "log/log.hpp"
#include "tfgen/flag_merger.hpp"

#include <iomanip>
#include <sstream>

namespace wheels::tfgen {

auto wrap_long_lines(std::string_view text, size_t width) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::istringstream iss{std::string(text)};
    for (std::string word; iss >> word;) {
        words.push_back(std::move(word));
    }
    if (words.empty()) {
        return {std::string(text)};
    }

    std::vector<std::string> lines;
    std::string wrapped = words[0];
    size_t space_left = width > wrapped.size() ? width - wrapped.size() : 0;
    for (size_t i = 1; i < words.size(); ++i) {
        const auto& word = words[i];
        if (word.size() + 1 > space_left) {
            lines.push_back(wrapped);
            wrapped = word;
            space_left = width > word.size() ? width - word.size() : 0;
        } else {
            wrapped += " " + word;
            space_left -= 1 + word.size();
        }
    }
    lines.push_back(wrapped);
    return lines;
}

void print_flag(std::ostream& out, const Flag& flag) {
    auto lines = wrap_long_lines(flag.usage, HELP_WRAP_WIDTH);
    std::string label = "-" + flag.name + "=";
    const auto pad = static_cast<int>(HELP_LABEL_WIDTH);

    out << "\n";
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i == 0 && label.size() > HELP_LABEL_WIDTH) {
            out << "  " << label << "\n";
            out << "  " << std::left << std::setw(pad) << "" << " " << lines[i] << "\n";
        } else if (i == 0) {
            out << "  " << std::left << std::setw(pad) << label << " " << lines[i] << "\n";
        } else {
            out << "  " << std::left << std::setw(pad) << "" << " " << lines[i] << "\n";
        }
    }
}

namespace {

auto trim_left(std::string_view s) -> std::string_view {
    size_t start = s.find_first_not_of(" \t");
    return start == std::string_view::npos ? std::string_view{} : s.substr(start);
}

} // namespace

auto split_block(std::string_view content, std::string_view header) -> Result<BlockSections> {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos <= content.size()) {
        size_t nl = content.find('\n', pos);
        if (nl == std::string_view::npos) {
            lines.emplace_back(content.substr(pos));
            break;
        }
        lines.emplace_back(content.substr(pos, nl - pos));
        pos = nl + 1;
    }

    format::HclFormatter scanner;
    auto scanned = scanner.bracket_depths(std::string(content));
    if (is_err(scanned)) {
        return unwrap_err(scanned);
    }
    const auto& depths = unwrap(scanned);

    size_t start = lines.size();
    for (size_t i = 0; i < lines.size(); ++i) {
        if (depths[i].code && trim_left(lines[i]).starts_with(header)) {
            start = i;
            break;
        }
    }
    if (start == lines.size()) {
        return Error("no block starting with '" + std::string(header) + "' found");
    }

    const size_t base = depths[start].before;
    if (depths[start].after <= base) {
        return Error("block '" + std::string(header) + "' at line " + std::to_string(start + 1) +
                     " does not open a multi-line body");
    }

    // The block ends on the line that brings the depth back to the header's
    size_t end = start + 1;
    while (end < lines.size() && depths[end].after > base) {
        ++end;
    }
    if (end >= lines.size()) {
        return Error("block '" + std::string(header) + "' opened at line " +
                     std::to_string(start + 1) + " is never closed");
    }

    BlockSections sections;
    sections.pre.assign(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(start) + 1);
    sections.body.assign(lines.begin() + static_cast<std::ptrdiff_t>(start) + 1,
                         lines.begin() + static_cast<std::ptrdiff_t>(end));
    sections.post.assign(lines.begin() + static_cast<std::ptrdiff_t>(end), lines.end());
    return sections;
}

void TerraformFileConfig::print_option_help(std::ostream& out) const {
    flags.visit_all([&](const Flag& flag) { print_flag(out, flag); });
}

auto TerraformFileConfig::generate(const format::FormatFn& formatter) const
    -> Result<std::string> {
    FlagMerger merger(list_flags, map_flags);
    auto merged = merger.merge(body_lines, flags.occurrences());
    if (is_err(merged)) {
        return unwrap_err(merged);
    }

    std::vector<std::string> all_lines = pre_lines;
    const auto& body = unwrap(merged);
    all_lines.insert(all_lines.end(), body.begin(), body.end());
    all_lines.insert(all_lines.end(), post_lines.begin(), post_lines.end());

    std::string content;
    for (size_t i = 0; i < all_lines.size(); ++i) {
        if (i > 0) {
            content += '\n';
        }
        content += all_lines[i];
    }

    auto formatted = formatter(content);
    if (is_err(formatted)) {
        WHEELS_LOG_DEBUG("tfgen", "Formatter rejected " << flags.name() << " output:\n"
                                                        << content);
        return unwrap_err(formatted).wrap("could not format output");
    }

    WHEELS_LOG_INFO("tfgen", "Generated " << all_lines.size() << " lines for " << flags.name());
    return unwrap(formatted);
}

} // namespace wheels::tfgen
