#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "ArchiveDecoder.hpp"
#include "ArchiveDiscovery.hpp"
#include "FileSystem.hpp"
#include "MultiPartFileReader.hpp"
#include "NzbParser.hpp"
#include "ParallelPreloader.hpp"
#include "PartFileReader.hpp"
#include "PartNaming.hpp"
#include "SegmentMapper.hpp"
#include "SegmentSource.hpp"


static constexpr uint32_t NZBSEEK_VERSION_MAJOR{ 0 };
static constexpr uint32_t NZBSEEK_VERSION_MINOR{ 1 };
static constexpr uint32_t NZBSEEK_VERSION_PATCH{ 0 };
static constexpr uint32_t NZBSEEK_VERSION{
    NZBSEEK_VERSION_MAJOR * 0x10000UL + NZBSEEK_VERSION_MINOR * 0x100UL + NZBSEEK_VERSION_PATCH
};


namespace nzbseek
{
static constexpr std::array<uint8_t, 3> VERSION = {
    NZBSEEK_VERSION_MAJOR,
    NZBSEEK_VERSION_MINOR,
    NZBSEEK_VERSION_PATCH,
};


static const std::string VERSION_STRING{
    std::to_string( NZBSEEK_VERSION_MAJOR ) + '.' +
    std::to_string( NZBSEEK_VERSION_MINOR ) + '.' +
    std::to_string( NZBSEEK_VERSION_PATCH )
};
}  // namespace nzbseek
