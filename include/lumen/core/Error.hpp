#pragma once

#include <system_error>

namespace lumen {

/**
 * @brief Specific failure codes raised by the fixture, model and output layers.
 *
 * Every code belongs to exactly one error_class (see classify()), which is
 * exposed as a std::error_condition so callers can write
 * `if (ec == lumen::error_class::structural_violation)`.
 */
enum class errc {
    // configuration_error
    malformed_config = 1,
    unknown_fixture_type,
    unknown_parameter,
    invalid_parameter,

    // structural_violation
    reentrant_mutation,
    duplicate_child,
    unknown_child,
    already_attached,
    packet_spec_outside_build,
    duplicate_packet_spec,
    unknown_packet_spec,
    model_builder_locked,
    invalid_argument,

    // addressing_error
    index_out_of_range,

    // protocol_encoding_error
    encoding_length_mismatch,
    unsupported_protocol
};

enum class error_class {
    configuration_error = 1,
    structural_violation,
    addressing_error,
    protocol_encoding_error
};

[[nodiscard]] error_class classify(errc code) noexcept;

const std::error_category& lumen_category() noexcept;
const std::error_category& error_class_category() noexcept;

std::error_code make_error_code(errc code) noexcept;
std::error_condition make_error_condition(error_class value) noexcept;

} // namespace lumen

namespace std {
template <>
struct is_error_code_enum<lumen::errc> : true_type {};

template <>
struct is_error_condition_enum<lumen::error_class> : true_type {};
} // namespace std
