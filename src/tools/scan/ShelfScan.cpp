/*
 * Copyright (C) 2026 Emeric Poupon
 *
 * This file is part of Shelf.
 *
 * Shelf is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Shelf is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Shelf.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "scanner/IFileParser.hpp"
#include "scanner/IFileSystem.hpp"
#include "scanner/IProgressEventSink.hpp"
#include "scanner/ScannerSettings.hpp"
#include "scanner/SeriesScanner.hpp"

namespace shelf
{
    void dumpSeries(std::ostream& os, const scanner::SeriesMap& series)
    {
        for (const auto& [identity, records] : series)
        {
            os << identity.name << " [" << scanner::toString(identity.format) << "] (" << identity.folderPath.string() << "): " << records.size() << " file(s)" << std::endl;
            for (const std::shared_ptr<scanner::ParsedRecord>& record : records)
            {
                os << "\t" << record->filename << ": volumes = '" << record->volumes << "', chapters = '" << record->chapters << "'";
                if (!record->localizedSeries.empty())
                    os << ", localized = '" << record->localizedSeries << "'";
                if (record->isSpecial)
                    os << ", special";
                os << std::endl;
            }
        }
    }
} // namespace shelf

int main(int argc, char* argv[])
{
    try
    {
        using namespace shelf;
        namespace program_options = boost::program_options;

        program_options::options_description options{ "Options" };

        // clang-format off
        options.add_options()
        ("conf,c", program_options::value<std::string>()->default_value("/etc/shelf-scan.conf"), "config file")
        ("folder,f", program_options::value<std::vector<std::string>>(), "folder to scan (overrides library-folders, can be repeated)")
        ("type,t", program_options::value<std::string>(), "library type: manga, comic, book or image (overrides library-type)")
        ("by-folder", "process files by folder batches (overrides library-scan-by-folder)")
        ("verbose,v", "log debug messages")
        ("help,h", "produce help message");
        // clang-format on

        program_options::variables_map vm;
        program_options::store(program_options::parse_command_line(argc, argv, options), vm);

        if (vm.count("help"))
        {
            std::cout << options << "\n";
            return EXIT_SUCCESS;
        }

        program_options::notify(vm);

        core::Service<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };

        core::logging::Severity minSeverity{ core::logging::defaultMinSeverity };
        if (vm.count("verbose"))
            minSeverity = core::logging::Severity::DEBUG;
        else if (const std::optional<core::logging::Severity> severity{ core::logging::parseSeverity(config->getString("log-min-severity", "info")) })
            minSeverity = *severity;
        else
            throw std::runtime_error{ "Invalid value for log-min-severity" };

        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(minSeverity, config->getPath("log-file", "")) };

        const scanner::ScannerSettings settings{ scanner::loadScannerSettings(*config) };
        scanner::LibraryInfo library{ scanner::loadLibraryInfo(*config) };

        if (vm.count("folder"))
        {
            library.folders.clear();
            for (const std::string& folder : vm["folder"].as<std::vector<std::string>>())
                library.folders.emplace_back(folder);
        }
        if (vm.count("type"))
        {
            const std::optional<scanner::LibraryType> type{ scanner::parseLibraryType(vm["type"].as<std::string>()) };
            if (!type)
                throw std::runtime_error{ "Invalid library type '" + vm["type"].as<std::string>() + "'" };
            library.type = *type;
        }
        if (vm.count("by-folder"))
            library.scanByFolder = true;

        if (library.folders.empty())
            throw std::runtime_error{ "No folder to scan" };

        const auto fileSystem{ scanner::createLocalFileSystem() };
        const auto parser{ scanner::createFilenameParser(*fileSystem) };
        const auto eventSink{ scanner::createLoggingProgressEventSink() };

        scanner::SeriesScanner seriesScanner{ *fileSystem, *parser, *eventSink, settings };

        SHELF_LOG(MAIN, INFO, "Scanning library '" << library.name << "' (" << scanner::toString(library.type) << ", " << library.folders.size() << " folder(s))");

        scanner::SeriesMap series;
        if (library.scanByFolder)
        {
            series = seriesScanner.scanLibrariesForSeriesByFolder(library.type, library.folders, library.name, true, [](std::span<const std::shared_ptr<scanner::ParsedRecord>> records) {
                SHELF_LOG(MAIN, DEBUG, "Folder batch of " << records.size() << " record(s) tracked");
            });
        }
        else
            series = seriesScanner.scanLibrariesForSeries(library.type, library.folders, library.name);

        dumpSeries(std::cout, series);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
