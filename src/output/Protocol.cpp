#include "lumen/output/Protocol.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace lumen::output {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const char* toString(Protocol protocol) {
    switch (protocol) {
        case Protocol::None:   return "none";
        case Protocol::ArtNet: return "artnet";
        case Protocol::Sacn:   return "sacn";
        case Protocol::Opc:    return "opc";
        case Protocol::Ddp:    return "ddp";
        case Protocol::Kinet:  return "kinet";
    }
    return "none";
}

const char* toString(KinetVersion version) {
    switch (version) {
        case KinetVersion::DmxOut:  return "dmxout";
        case KinetVersion::PortOut: return "portout";
    }
    return "portout";
}

const char* toString(ByteOrder order) {
    switch (order) {
        case ByteOrder::RGB: return "rgb";
        case ByteOrder::RBG: return "rbg";
        case ByteOrder::GRB: return "grb";
        case ByteOrder::GBR: return "gbr";
        case ByteOrder::BRG: return "brg";
        case ByteOrder::BGR: return "bgr";
    }
    return "rgb";
}

std::optional<Protocol> protocolFromString(std::string_view name) {
    const auto key = lowercase(name);
    for (auto p : {Protocol::None, Protocol::ArtNet, Protocol::Sacn,
                   Protocol::Opc, Protocol::Ddp, Protocol::Kinet}) {
        if (key == toString(p)) return p;
    }
    if (key == "e131" || key == "e1.31") return Protocol::Sacn;
    return std::nullopt;
}

std::optional<KinetVersion> kinetVersionFromString(std::string_view name) {
    const auto key = lowercase(name);
    if (key == "dmxout") return KinetVersion::DmxOut;
    if (key == "portout") return KinetVersion::PortOut;
    return std::nullopt;
}

std::optional<ByteOrder> byteOrderFromString(std::string_view name) {
    const auto key = lowercase(name);
    for (auto order : {ByteOrder::RGB, ByteOrder::RBG, ByteOrder::GRB,
                       ByteOrder::GBR, ByteOrder::BRG, ByteOrder::BGR}) {
        if (key == toString(order)) return order;
    }
    return std::nullopt;
}

std::array<std::uint8_t, BYTES_PER_POINT> channelLayout(ByteOrder order) {
    switch (order) {
        case ByteOrder::RGB: return {0, 1, 2};
        case ByteOrder::RBG: return {0, 2, 1};
        case ByteOrder::GRB: return {1, 0, 2};
        case ByteOrder::GBR: return {1, 2, 0};
        case ByteOrder::BRG: return {2, 0, 1};
        case ByteOrder::BGR: return {2, 1, 0};
    }
    return {0, 1, 2};
}

} // namespace lumen::output
