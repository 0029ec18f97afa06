// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Build metadata, normally injected by CMake via compile definitions.

#ifndef CHECK_HTTP_NAME
    #define CHECK_HTTP_NAME "check-http"
#endif

#ifndef CHECK_HTTP_VERSION
    #define CHECK_HTTP_VERSION "0.0.0"
#endif

#ifndef CHECK_HTTP_GIT_COMMIT
    #define CHECK_HTTP_GIT_COMMIT "unknown"
#endif

// Installed location of the check definition schema
#ifndef CHECK_HTTP_DEFAULT_SCHEMA_PATH
    #define CHECK_HTTP_DEFAULT_SCHEMA_PATH "/usr/local/share/check-http/check.schema.json"
#endif
