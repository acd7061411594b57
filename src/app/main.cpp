#include "core/Logging.hpp"
#include "fms/Fms.hpp"
#include "io/GeoJsonExporter.hpp"
#include "io/JsonRecordSource.hpp"
#include "nd/RecordConverter.hpp"
#include <charconv>
#include <iostream>
#include <filesystem>
#include <optional>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

using namespace efb;

// 命令行选项结构
struct CommandLineOptions {
    std::vector<std::string> dataFiles;
    std::string route;
    std::string alternate;
    std::optional<geo::Coordinate> at;
    double radiusNm{10.0};
    std::string geojsonFile;
    bool verbose{false};
    bool quiet{false};
    std::string logFile;
};

// "lat,lon"
std::optional<geo::Coordinate> parseCoordinate(std::string_view text) {
    const auto comma = text.find(',');
    if (comma == std::string_view::npos) {
        return std::nullopt;
    }
    double lat = 0.0;
    double lon = 0.0;
    const auto latPart = text.substr(0, comma);
    const auto lonPart = text.substr(comma + 1);
    if (std::from_chars(latPart.data(), latPart.data() + latPart.size(), lat).ec != std::errc{} ||
        std::from_chars(lonPart.data(), lonPart.data() + lonPart.size(), lon).ec != std::errc{}) {
        return std::nullopt;
    }
    if (lat < -90.0 || lat > 90.0 || lon < -180.0 || lon > 180.0) {
        return std::nullopt;
    }
    return geo::Coordinate{lat, lon};
}

// 解析命令行参数
std::expected<CommandLineOptions, std::string> parseCommandLine(int argc, char* argv[]) {
    try {
        cxxopts::Options options("efbnav", "Route decoding and airspace profile for VFR navigation data");

        options.add_options()
            ("d,data", "JSON record file (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("r,route", "Route string, e.g. \"N0107 A0250 EDDH DCT EDHL\"", cxxopts::value<std::string>())
            ("alternate", "Alternate ident", cxxopts::value<std::string>())
            ("at", "Query position as lat,lon", cxxopts::value<std::string>())
            ("radius", "Query radius in NM", cxxopts::value<double>()->default_value("10"))
            ("geojson", "GeoJSON output file", cxxopts::value<std::string>())
            ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", "Quiet mode", cxxopts::value<bool>()->default_value("false"))
            ("log-file", "Log file path", cxxopts::value<std::string>())
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            std::exit(0);
        }

        CommandLineOptions opts;

        if (result.count("data")) {
            opts.dataFiles = result["data"].as<std::vector<std::string>>();
        } else {
            return std::unexpected("At least one data file is required");
        }

        if (result.count("route")) {
            opts.route = result["route"].as<std::string>();
        }
        if (result.count("alternate")) {
            opts.alternate = result["alternate"].as<std::string>();
        }
        if (result.count("at")) {
            opts.at = parseCoordinate(result["at"].as<std::string>());
            if (!opts.at) {
                return std::unexpected("Invalid position, expected lat,lon");
            }
        }
        if (opts.route.empty() && !opts.at) {
            return std::unexpected("Nothing to do, give --route or --at");
        }

        opts.radiusNm = result["radius"].as<double>();
        if (opts.radiusNm <= 0.0) {
            return std::unexpected("Radius must be positive");
        }
        opts.verbose = result["verbose"].as<bool>();
        opts.quiet = result["quiet"].as<bool>();

        if (result.count("geojson")) {
            opts.geojsonFile = result["geojson"].as<std::string>();
        }
        if (result.count("log-file")) {
            opts.logFile = result["log-file"].as<std::string>();
        }

        return opts;

    } catch (const std::exception& e) {
        return std::unexpected(std::string("Command line parsing error: ") + e.what());
    }
}

// 每个文件一个分区
core::Result<nd::NavigationData> loadNavigationData(const std::vector<std::string>& files) {
    nd::NavigationData data;
    for (const auto& file : files) {
        auto source = io::JsonRecordSource::fromFile(file);
        if (!source) {
            return std::unexpected(source.error());
        }

        nd::NavigationDataBuilder builder;
        builder.withSource(file);
        auto partition = nd::loadFixedRecords(*source, std::move(builder));

        for (const auto& error : partition.errors()) {
            spdlog::warn("{}: {}", file, error);
        }
        data.append(std::move(partition));
    }
    return data;
}

void showNearby(const nd::NavigationData& data, const geo::Coordinate& at, double radiusNm) {
    const auto nearby = data.at(at, core::Length::nm(radiusNm));

    spdlog::info("=== {} ===", at.toString());
    for (const auto& airspace : nearby.airspaces) {
        spdlog::info("  {} {} {} - {}", nd::toString(airspace->type), airspace->name,
                     airspace->floor, airspace->ceiling);
    }
    for (const auto& navaid : nearby.navaids) {
        spdlog::info("  {} {:.1f} NM", navaid.ident(), at.dist(navaid.coordinate()).nauticalMiles());
    }
}

// 显示航路摘要
void showRouteSummary(const fms::Fms& fms, const route::VerticalProfile& profile) {
    const auto& route = fms.route();

    spdlog::info("=== Route ===");
    spdlog::info("{}", route.toString());
    if (route.origin()) {
        spdlog::info("Origin: {}", route.origin()->ident());
    }
    if (route.destination()) {
        spdlog::info("Destination: {}", route.destination()->ident());
    }

    for (const auto& leg : route.legs()) {
        spdlog::info("  {:<6} -> {:<6} MC {:03.0f} {:6.1f} NM{}",
                     leg.from().ident(), leg.to().ident(), leg.mc().degrees(),
                     leg.dist().nauticalMiles(),
                     leg.ete() ? " " + leg.ete()->toString() : std::string());
    }
    if (auto totals = route.totals()) {
        spdlog::info("Total: {:.1f} NM{}", totals->dist.nauticalMiles(),
                     totals->ete ? " " + totals->ete->toString() : std::string());
    }
    if (auto alternate = route.alternate()) {
        spdlog::info("Alternate: {} {:.1f} NM", alternate->to().ident(), alternate->dist().nauticalMiles());
    }

    spdlog::info("=== Airspaces ===");
    for (const auto& intersection : profile.intersections()) {
        spdlog::info("  {:6.1f} - {:6.1f} NM {} {} ({} - {})",
                     intersection.entryDistance.nauticalMiles(),
                     intersection.exitDistance.nauticalMiles(),
                     nd::toString(intersection.airspace->type),
                     intersection.airspace->name,
                     intersection.floor(), intersection.ceiling());
    }
    if (auto maxLevel = profile.maxLevel()) {
        spdlog::info("Max level: {}", *maxLevel);
    }
}

int main(int argc, char* argv[]) {
    try {
        // 解析命令行
        auto optsResult = parseCommandLine(argc, argv);
        if (!optsResult) {
            std::cerr << "Error: " << optsResult.error() << std::endl;
            return 1;
        }
        const auto opts = *optsResult;

        // 设置日志
        core::setupLogging({"efbnav", opts.verbose, opts.quiet, opts.logFile});

        auto data = loadNavigationData(opts.dataFiles);
        if (!data) {
            spdlog::error("Failed to load navigation data: {}", data.error());
            return 1;
        }
        spdlog::info("Loaded {} data file(s)", opts.dataFiles.size());

        if (opts.at) {
            showNearby(*data, *opts.at, opts.radiusNm);
        }
        if (opts.route.empty()) {
            return 0;
        }

        fms::Fms fms(std::move(*data));
        if (auto decoded = fms.decode(opts.route); !decoded) {
            spdlog::error("Route decode failed: {}", decoded.error());
            return 1;
        }
        if (!opts.alternate.empty()) {
            if (auto alternate = fms.setAlternate(opts.alternate); !alternate) {
                spdlog::error("Alternate rejected: {}", alternate.error());
                return 1;
            }
        }

        const auto& profile = fms.profile();
        showRouteSummary(fms, profile);

        if (!opts.geojsonFile.empty()) {
            io::GeoJsonExporter exporter;
            if (auto written = exporter.write(exporter.build(fms.route(), profile), opts.geojsonFile); !written) {
                spdlog::error("GeoJSON export failed: {}", written.error());
                return 1;
            }
        }

        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
