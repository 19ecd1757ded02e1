#include "common.h"


std::vector<std::string> lacq::split_lines(const std::string_view text)
{
    std::vector<std::string> lines;
    size_t begin = 0;
    while (begin <= text.size()) {
        size_t end = text.find('\n', begin);
        if (end == std::string_view::npos) {
            end = text.size();
        }

        std::string line(text.substr(begin, end - begin));
        line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
        if (line.find_first_not_of(" \t") != std::string::npos) {
            lines.push_back(std::move(line));
        }
        begin = end + 1;
    }
    return lines;
}

std::vector<std::string> lacq::parse_disk_shares(const std::string_view text)
{
    static const std::regex re_disk_row(R"(^[ \t]*(.*[^ \t])[ \t]+Disk(?:[ \t].*)?$)");

    std::vector<std::string> shares;
    for (const std::string& line : split_lines(text)) {
        std::smatch match;
        if (std::regex_match(line, match, re_disk_row)) {
            shares.push_back(match[1].str());
        }
    }
    return shares;
}

std::vector<lacq::attached_volume> lacq::parse_hdiutil_volumes(const std::string_view text)
{
    static const std::regex re_volume_row(R"(^[ \t]*(/dev/[^ \t]+)[ \t]+(?:.*?[ \t])?(/Volumes/.*[^ \t])[ \t]*$)");

    std::vector<attached_volume> volumes;
    for (const std::string& line : split_lines(text)) {
        std::smatch match;
        if (std::regex_match(line, match, re_volume_row)) {
            volumes.push_back({ match[1].str(), stdfs::path(match[2].str()) });
        }
    }
    return volumes;
}

std::vector<std::string> lacq::parse_udisks_loop_devices(const std::string_view text)
{
    static const std::regex re_mapped(R"(^Mapped file .* as (/dev/[^ \t]+?)\.?[ \t]*$)");

    std::vector<std::string> devices;
    for (const std::string& line : split_lines(text)) {
        std::smatch match;
        if (std::regex_match(line, match, re_mapped)) {
            devices.push_back(match[1].str());
        }
    }
    return devices;
}

std::vector<lacq::attached_volume> lacq::parse_udisks_mounts(const std::string_view text)
{
    static const std::regex re_mounted(R"(^Mounted (/dev/[^ \t]+) at (/.*[^ \t])[ \t]*$)");

    std::vector<attached_volume> volumes;
    for (const std::string& line : split_lines(text)) {
        std::smatch match;
        if (std::regex_match(line, match, re_mounted)) {
            std::string mount_path = match[2].str();
            // Older udisks versions end the sentence with a period
            if (mount_path.size() > 1 && mount_path.back() == '.') {
                mount_path.pop_back();
            }
            volumes.push_back({ match[1].str(), stdfs::path(mount_path) });
        }
    }
    return volumes;
}

std::optional<std::string> lacq::parse_digest(const std::string_view text, const size_t hex_length)
{
    const size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return std::nullopt;
    }
    size_t end = text.find_first_of(" \t\r\n", begin);
    if (end == std::string_view::npos) {
        end = text.size();
    }

    std::string token(text.substr(begin, end - begin));
    if (token.size() != hex_length) {
        return std::nullopt;
    }
    for (char& ch : token) {
        if (!std::isxdigit(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return token;
}
