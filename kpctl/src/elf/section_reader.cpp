/**
 * ELF section string extraction for patch modules.
 */

#include "section_reader.hpp"
#include "../log.hpp"

#include <cstring>
#include <fstream>

#include <elf.h>

namespace kpctl {

namespace {

bool read_binary(const std::string& path, std::vector<uint8_t>& buffer) {
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs.is_open()) {
        LOGD("Cannot open file: %s", path.c_str());
        return false;
    }

    auto size = ifs.tellg();
    if (size < 0) {
        LOGE("Cannot size file: %s", path.c_str());
        return false;
    }
    ifs.seekg(0, std::ios::beg);

    buffer.resize(static_cast<size_t>(size));
    if (!ifs.read(reinterpret_cast<char*>(buffer.data()), size)) {
        LOGE("Cannot read file: %s", path.c_str());
        return false;
    }

    return true;
}

bool in_bounds(const std::vector<uint8_t>& buffer, uint64_t offset, uint64_t size) {
    return offset <= buffer.size() && size <= buffer.size() - offset;
}

// e_shoff carries no alignment guarantee
Elf64_Shdr read_shdr(const std::vector<uint8_t>& buffer, uint64_t shoff, unsigned index) {
    Elf64_Shdr shdr;
    memcpy(&shdr, buffer.data() + shoff + uint64_t{index} * sizeof(Elf64_Shdr), sizeof(shdr));
    return shdr;
}

bool is_printable(char c) {
    return (c >= 0x20 && c < 0x7f) || c == '\t';
}

}  // anonymous namespace

std::vector<std::string> extract_strings(const uint8_t* data, size_t size) {
    std::vector<std::string> strings;
    std::string current;
    bool printable = true;

    for (size_t i = 0; i < size; i++) {
        char c = static_cast<char>(data[i]);
        if (c == '\0') {
            if (!current.empty() && printable) {
                strings.push_back(current);
            }
            current.clear();
            printable = true;
            continue;
        }
        if (!is_printable(c)) {
            printable = false;
        }
        current += c;
    }

    // Trailing string without terminator
    if (!current.empty() && printable) {
        strings.push_back(current);
    }

    return strings;
}

std::optional<std::vector<std::string>> ElfSectionReader::section_strings(
    const std::string& path, const std::string& section) {
    std::vector<uint8_t> buffer;
    if (!read_binary(path, buffer)) {
        return std::nullopt;
    }

    if (buffer.size() < sizeof(Elf64_Ehdr)) {
        LOGE("%s: file too small to be an ELF", path.c_str());
        return std::nullopt;
    }

    auto* ehdr = reinterpret_cast<const Elf64_Ehdr*>(buffer.data());
    if (memcmp(ehdr->e_ident, ELFMAG, SELFMAG) != 0) {
        LOGE("%s: invalid ELF magic", path.c_str());
        return std::nullopt;
    }

    // Kernel modules we manage are 64-bit only
    if (ehdr->e_ident[EI_CLASS] != ELFCLASS64) {
        LOGE("%s: only 64-bit ELF supported", path.c_str());
        return std::nullopt;
    }

    if (ehdr->e_shentsize != sizeof(Elf64_Shdr) ||
        !in_bounds(buffer, ehdr->e_shoff, uint64_t{ehdr->e_shnum} * sizeof(Elf64_Shdr)) ||
        ehdr->e_shstrndx >= ehdr->e_shnum) {
        LOGE("%s: malformed section header table", path.c_str());
        return std::nullopt;
    }

    Elf64_Shdr names = read_shdr(buffer, ehdr->e_shoff, ehdr->e_shstrndx);
    if (!in_bounds(buffer, names.sh_offset, names.sh_size)) {
        LOGE("%s: malformed section name table", path.c_str());
        return std::nullopt;
    }
    auto* name_base = reinterpret_cast<const char*>(buffer.data() + names.sh_offset);

    for (unsigned i = 0; i < ehdr->e_shnum; i++) {
        Elf64_Shdr shdr = read_shdr(buffer, ehdr->e_shoff, i);
        if (shdr.sh_name >= names.sh_size) {
            continue;
        }

        const char* name = name_base + shdr.sh_name;
        size_t max_len = names.sh_size - shdr.sh_name;
        if (strnlen(name, max_len) != section.size() ||
            memcmp(name, section.data(), section.size()) != 0) {
            continue;
        }

        if (shdr.sh_type == SHT_NOBITS) {
            return std::vector<std::string>{};
        }
        if (!in_bounds(buffer, shdr.sh_offset, shdr.sh_size)) {
            LOGE("%s: section %s out of bounds", path.c_str(), section.c_str());
            return std::nullopt;
        }
        return extract_strings(buffer.data() + shdr.sh_offset, shdr.sh_size);
    }

    LOGD("%s: no section %s", path.c_str(), section.c_str());
    return std::nullopt;
}

}  // namespace kpctl
