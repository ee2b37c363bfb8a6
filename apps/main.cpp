#include "lumen/log/Log.hpp"
#include "lumen/net/UdpTransport.hpp"
#include "lumen/output/OutputLoop.hpp"
#include "lumen/structure/GroupFixture.hpp"
#include "lumen/structure/StripFixture.hpp"
#include "lumen/structure/Structure.hpp"

#include <cxxopts.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace lumen;

namespace {

// Two KiNET strips on one power supply, ports 1 and 2, inside a group.
expected<void> buildDemoStructure(structure::Structure& structure, const std::string& host) {
    auto group = std::make_unique<structure::GroupFixture>("Demo");
    for (int port = 1; port <= 2; ++port) {
        auto strip = std::make_unique<structure::StripFixture>("Strip " + std::to_string(port));
        for (auto [key, value] : std::initializer_list<std::pair<const char*, structure::Parameter::Value>>{
                 {"numPoints", 50},
                 {"y", 20.0 * port},
                 {"protocol", std::string("kinet")},
                 {"host", host},
                 {"kinetPort", port}}) {
            if (auto ok = strip->setParameter(key, value); !ok) return ok;
        }
        if (auto ok = group->addChild(std::move(strip)); !ok) return ok;
    }
    return structure.addFixture(std::move(group));
}

std::uint32_t hsvToArgb(float hue, float value) {
    const float h = std::fmod(hue, 1.0f) * 6.0f;
    const float x = 1.0f - std::fabs(std::fmod(h, 2.0f) - 1.0f);
    float r = 0.0f, g = 0.0f, b = 0.0f;
    if (h < 1.0f)      { r = 1.0f; g = x; }
    else if (h < 2.0f) { r = x; g = 1.0f; }
    else if (h < 3.0f) { g = 1.0f; b = x; }
    else if (h < 4.0f) { g = x; b = 1.0f; }
    else if (h < 5.0f) { r = x; b = 1.0f; }
    else               { r = 1.0f; b = x; }
    auto channel = [value](float c) { return static_cast<std::uint32_t>(c * value * 255.0f + 0.5f); };
    return 0xFF000000u | (channel(r) << 16) | (channel(g) << 8) | channel(b);
}

} // namespace

int main(int argc, char** argv) {
    cxxopts::Options options("lumen_demo", "Stream a rainbow test pattern to a fixture structure");
    options.add_options()
        ("s,structure", "Structure file to load (JSON)", cxxopts::value<std::string>())
        ("host", "Controller address for the built-in demo structure",
            cxxopts::value<std::string>()->default_value("127.0.0.1"))
        ("save", "Write the loaded structure back to this file", cxxopts::value<std::string>())
        ("f,fps", "Output frame rate", cxxopts::value<double>()->default_value("60"))
        ("t,seconds", "How long to run, 0 = single frame", cxxopts::value<int>()->default_value("10"))
        ("b,brightness", "Pattern brightness 0..1", cxxopts::value<float>()->default_value("0.5"))
        ("h,help", "Print usage");

    std::string structurePath;
    std::string host;
    std::string savePath;
    double fps = 60.0;
    int seconds = 10;
    float level = 0.5f;
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        if (result.count("structure")) structurePath = result["structure"].as<std::string>();
        if (result.count("save")) savePath = result["save"].as<std::string>();
        host = result["host"].as<std::string>();
        fps = result["fps"].as<double>();
        seconds = result["seconds"].as<int>();
        level = result["brightness"].as<float>();
    } catch (const std::exception& e) {
        logError("Invalid arguments: ", e.what(), "\n");
        std::cerr << options.help() << std::endl;
        return 1;
    }

    structure::Structure structure;
    auto loaded = structurePath.empty() ? buildDemoStructure(structure, host)
                                        : structure.loadFile(structurePath);
    if (!loaded) {
        const auto err = loaded.error();
        logError("Structure setup failed: ", err.message(),
                 " (", err.category().name(), ":", err.value(), ")\n");
        return 1;
    }

    if (!savePath.empty()) {
        if (auto saved = structure.saveFile(savePath); !saved) {
            logError("Could not save structure: ", saved.error().message(), "\n");
        }
    }

    const auto model = structure.model();
    const auto bounds = model->bounds();
    logInfo("Model has ", model->size(), " point(s), ",
            structure.outputFrame()->entries.size(), " packet(s) per frame\n");

    auto transport = std::make_shared<net::UdpTransport>();
    output::OutputLoop loop([&structure] { return structure.outputFrame(); }, transport);
    loop.setFrameRate(fps);

    // Rainbow sweeping along x, using the model snapshot for positions.
    loop.setRequestColorsCallback(
        [model, bounds, level](const output::FrameRequest& req, std::vector<std::uint32_t>& colors) {
            const float width = std::max(bounds.extent().x, 1.0f);
            const float phase = static_cast<float>(req.frameIndex % 240) / 240.0f;
            for (std::size_t i = 0; i < model->size(); ++i) {
                const auto& p = model->point(i);
                if (p.index >= colors.size()) continue;
                const float u = (p.position.x - bounds.min.x) / width;
                colors[p.index] = hsvToArgb(u + phase, level);
            }
        });

    if (seconds <= 0) {
        loop.tick();
    } else {
        loop.start();
        std::this_thread::sleep_for(std::chrono::seconds(seconds));
        loop.stop();
    }

    logInfo("Sent ", loop.packetsSent(), " packet(s) in ", loop.framesSent(), " frame(s), ",
            loop.encodeFailures(), " encode failure(s), ", transport->failedSends(), " send failure(s)\n");
    return 0;
}
