// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "status_text.hpp"

#include <httplib.h>

#include <array>
#include <utility>

namespace checkhttp {

namespace {

constexpr int INTERNAL_SERVER_ERROR = 500;

// Phrases where the conventional text differs from httplib's table.
// 306 is reserved and has no phrase.
constexpr std::array<std::pair<int, const char*>, 5> PHRASE_OVERRIDES{{
    {306, ""},
    {413, "Request Entity Too Large"},
    {414, "Request URI Too Long"},
    {416, "Requested Range Not Satisfiable"},
    {422, "Unprocessable Entity"},
}};

} // namespace

std::string reason_phrase(int code) {
    for (const auto& [override_code, override_phrase] : PHRASE_OVERRIDES) {
        if (override_code == code) {
            return override_phrase;
        }
    }

    std::string phrase = httplib::status_message(code);

    // httplib falls back to the 500 phrase for codes outside its table
    if (code != INTERNAL_SERVER_ERROR && phrase == httplib::status_message(INTERNAL_SERVER_ERROR)) {
        return "";
    }
    return phrase;
}

std::string status_line(int code) {
    return std::to_string(code) + " " + reason_phrase(code);
}

} // namespace checkhttp
