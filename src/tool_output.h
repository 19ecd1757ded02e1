#if !defined(_LACQ_TOOL_OUTPUT_H_INCLUDED_)
#define _LACQ_TOOL_OUTPUT_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)


//
// Parsers for the textual output of external tools.
// They return every candidate they find: deciding whether zero or several
// candidates are acceptable is up to the caller.
//
namespace lacq
{
    struct attached_volume
    {
        std::string device;
        stdfs::path mount_path;
    };

    // Rows like "Macintosh HD    Disk    comment" of `smbutil view` or `smbclient -L`
    std::vector<std::string> parse_disk_shares(std::string_view text);

    // Rows like "/dev/disk5s1  41504653-0000-11AA-AA11-0030654  /Volumes/ACQUISITION" of `hdiutil create -attach`
    std::vector<attached_volume> parse_hdiutil_volumes(std::string_view text);

    // "Mapped file /out/ACQUISITION.img as /dev/loop0." of `udisksctl loop-setup`
    std::vector<std::string> parse_udisks_loop_devices(std::string_view text);

    // "Mounted /dev/loop0 at /media/user/ACQUISITION" of `udisksctl mount`
    std::vector<attached_volume> parse_udisks_mounts(std::string_view text);

    // First token of `md5 -q`, `md5sum`, `sha1sum` or `openssl sha1 -r`, lower-cased.
    // Empty if the token is not a hex digest of the expected length.
    std::optional<std::string> parse_digest(std::string_view text, size_t hex_length);

    // Split on '\n', dropping '\r' and empty lines
    std::vector<std::string> split_lines(std::string_view text);

}  // namespace lacq

#endif  // !defined(_LACQ_TOOL_OUTPUT_H_INCLUDED_)
