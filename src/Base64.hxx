// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * Encode with the standard base64 alphabet (RFC 4648 section 4).
 *
 * @param padding emit trailing '=' characters?
 */
std::string
EncodeBase64(std::span<const std::byte> src, bool padding=true);

/**
 * Decode standard base64 (padding is optional).
 *
 * @return std::nullopt on error
 */
std::optional<std::vector<std::byte>>
DecodeBase64(std::string_view src);
