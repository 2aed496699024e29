#pragma once

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <cxxopts.hpp>

#include <core/common.hpp>
#include <nzbseek/PartNaming.hpp>


[[nodiscard]] inline std::string
getLastValue( cxxopts::ParseResult const& parsedArgs,
              std::string          const& argument )
{
    if ( parsedArgs.count( argument ) > 1 ) {
        if ( parsedArgs.count( "quiet" ) == 0 ) {
            std::cerr << "[Warning] Option '" << argument << "' specified multiple times. Will only use the last one: "
                      << parsedArgs[argument].as<std::string>() << "!\n";
        }
    }
    if ( parsedArgs.count( argument ) > 0 ) {
        return parsedArgs[argument].as<std::string>();
    }
    return {};
}


/**
 * @return std::nullopt for "auto", which means that the format should be detected from the part names.
 */
[[nodiscard]] inline std::optional<nzbseek::ArchiveFormat>
parseArchiveFormat( const std::string& name )
{
    const auto lower = nzbseek::toLower( name );
    if ( lower.empty() || ( lower == "auto" ) ) {
        return std::nullopt;
    }
    if ( lower == "rar" ) {
        return nzbseek::ArchiveFormat::RAR;
    }
    if ( ( lower == "7z" ) || ( lower == "7zip" ) ) {
        return nzbseek::ArchiveFormat::SEVEN_ZIP;
    }
    throw std::invalid_argument( "Unknown archive format '" + name + "'. Expected one of: auto, rar, 7z." );
}
