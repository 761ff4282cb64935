#pragma once

#include <cstddef>
#include <cstdint>

namespace clipforge::constants {

// Visual (signed) service
constexpr const char* DEFAULT_VISUAL_ENDPOINT = "https://visual.volcengineapi.com";
constexpr const char* DEFAULT_VISUAL_VERSION = "2022-08-31";
constexpr const char* DEFAULT_SUBMIT_ACTION = "CVSubmitTask";
constexpr const char* DEFAULT_RESULT_ACTION = "CVGetResult";
constexpr const char* DEFAULT_SIGNING_REGION = "cn-north-1";
constexpr const char* DEFAULT_SIGNING_SERVICE = "cv";

// Request keys for the visual service
constexpr const char* REQ_KEY_IDENTIFY = "realman_avatar_picture_create_role_omni";
constexpr const char* REQ_KEY_AVATAR = "realman_avatar_picture_omni_v2";

// Ark (token) service
constexpr const char* DEFAULT_ARK_ENDPOINT = "https://ark.cn-beijing.volces.com/api/v3";
constexpr const char* ARK_TASKS_PATH = "/contents/generations/tasks";
constexpr const char* DEFAULT_VIDEO_MODEL = "doubao-seedance-1-0-pro-250528";

// Polling defaults
constexpr int DEFAULT_MAX_POLL_ATTEMPTS = 60;
constexpr int DEFAULT_POLL_INTERVAL_SECONDS = 5;

// HTTP defaults
constexpr int DEFAULT_CONNECT_TIMEOUT_SECONDS = 30;
constexpr int DEFAULT_REQUEST_TIMEOUT_SECONDS = 300;
constexpr size_t DOWNLOAD_CHUNK_SIZE = 8192;                        // 8KB

// Video generation parameter ranges
constexpr int64_t MIN_SEED = -1;
constexpr int64_t MAX_SEED = 2147483647;

// Environment variables consulted for credentials
constexpr const char* ENV_ACCESS_KEY = "VOLC_ACCESSKEY";
constexpr const char* ENV_SECRET_KEY = "VOLC_SECRETKEY";
constexpr const char* ENV_API_KEY = "ARK_API_KEY";

} // namespace clipforge::constants
