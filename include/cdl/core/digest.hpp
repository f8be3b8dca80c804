#pragma once

/** \file digest.hpp
 *  \brief SHA-256 helpers for constraint ids and result fingerprints.
 */

#include <cstddef>
#include <string>
#include <string_view>

namespace cdl::core {

/** \brief Upper-case hex SHA-256 of \p data (64 characters). */
auto sha256_hex(std::string_view data) -> std::string;

/** \brief First \p chars characters of sha256_hex(data). */
auto short_digest(std::string_view data, std::size_t chars) -> std::string;

} // namespace cdl::core
