#pragma once

#include "config.hpp"
#include "elf/section_reader.hpp"
#include "host.hpp"

namespace kpctl {

// Collaborators threaded through every patch operation
struct Runtime {
    Host& host;
    SectionReader& reader;
    Config config;
};

}  // namespace kpctl
