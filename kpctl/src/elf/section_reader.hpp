#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kpctl {

// Reads strings embedded in a named section of a module binary. This is the
// only place that understands the binary format.
class SectionReader {
public:
    virtual ~SectionReader() = default;

    // Printable NUL-terminated strings of |section| in file order, or nullopt
    // when the file or the section is missing.
    virtual std::optional<std::vector<std::string>> section_strings(
        const std::string& path, const std::string& section) = 0;
};

class ElfSectionReader : public SectionReader {
public:
    std::optional<std::vector<std::string>> section_strings(const std::string& path,
                                                            const std::string& section) override;
};

// Split raw section bytes into their printable strings
std::vector<std::string> extract_strings(const uint8_t* data, size_t size);

}  // namespace kpctl
