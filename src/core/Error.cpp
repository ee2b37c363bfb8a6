#include "lumen/core/Error.hpp"

#include <string>

namespace lumen {

namespace {

class LumenCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "lumen"; }

    std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
            case errc::malformed_config:          return "malformed fixture configuration";
            case errc::unknown_fixture_type:      return "unknown fixture type";
            case errc::unknown_parameter:         return "unknown parameter";
            case errc::invalid_parameter:         return "invalid parameter value";
            case errc::reentrant_mutation:        return "structural mutation while iterating";
            case errc::duplicate_child:           return "duplicate child fixture";
            case errc::unknown_child:             return "unknown child fixture";
            case errc::already_attached:          return "fixture already attached to a container";
            case errc::packet_spec_outside_build: return "packet spec modified outside its build callback";
            case errc::duplicate_packet_spec:     return "duplicate packet spec";
            case errc::unknown_packet_spec:       return "unknown packet spec";
            case errc::model_builder_locked:      return "model builder already converted to a model";
            case errc::invalid_argument:          return "invalid argument";
            case errc::index_out_of_range:        return "point offset exceeds fixture size";
            case errc::encoding_length_mismatch:  return "packet body and index buffer length mismatch";
            case errc::unsupported_protocol:      return "unsupported output protocol";
        }
        return "unknown lumen error";
    }

    std::error_condition default_error_condition(int value) const noexcept override {
        return make_error_condition(classify(static_cast<errc>(value)));
    }
};

class ErrorClassCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "lumen.class"; }

    std::string message(int value) const override {
        switch (static_cast<error_class>(value)) {
            case error_class::configuration_error:     return "configuration error";
            case error_class::structural_violation:    return "structural violation";
            case error_class::addressing_error:        return "addressing error";
            case error_class::protocol_encoding_error: return "protocol encoding error";
        }
        return "unknown error class";
    }
};

} // namespace

error_class classify(errc code) noexcept {
    switch (code) {
        case errc::malformed_config:
        case errc::unknown_fixture_type:
        case errc::unknown_parameter:
        case errc::invalid_parameter:
            return error_class::configuration_error;
        case errc::index_out_of_range:
            return error_class::addressing_error;
        case errc::encoding_length_mismatch:
        case errc::unsupported_protocol:
            return error_class::protocol_encoding_error;
        default:
            return error_class::structural_violation;
    }
}

const std::error_category& lumen_category() noexcept {
    static const LumenCategory category;
    return category;
}

const std::error_category& error_class_category() noexcept {
    static const ErrorClassCategory category;
    return category;
}

std::error_code make_error_code(errc code) noexcept {
    return {static_cast<int>(code), lumen_category()};
}

std::error_condition make_error_condition(error_class value) noexcept {
    return {static_cast<int>(value), error_class_category()};
}

} // namespace lumen
