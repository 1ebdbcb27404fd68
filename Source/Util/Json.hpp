//
// Created by usr on 27/10/2025.
//

#pragma once
#include <json11.hpp>

using WJson = json11::Json;

// Json consts
#define wJC static constexpr char const*

wJC JSON_KEY_PORT = "port";
wJC JSON_KEY_PID = "pid";
wJC JSON_KEY_NAME = "name";
wJC JSON_KEY_USERNAME = "username";
wJC JSON_KEY_ADDRESS = "address";
wJC JSON_KEY_PROTOCOL = "type";
wJC JSON_KEY_CONN_STATUS = "conn_status";
wJC JSON_KEY_APP_TYPE = "app_type";
wJC JSON_KEY_IS_SYSTEM = "is_system";
wJC JSON_KEY_PARENT_PID = "parent_pid";
wJC JSON_KEY_ROOT_PID = "root_controller_pid";
wJC JSON_KEY_ROOT_NAME = "root_controller_name";
wJC JSON_KEY_HAS_CONTROLLER = "has_parent_controller";
wJC JSON_KEY_SYSTEM = "system";
wJC JSON_KEY_USER = "user";
wJC JSON_KEY_COUNTS = "counts";
wJC JSON_KEY_IS_ADMIN = "is_admin";
wJC JSON_KEY_DATA = "data";
