// Copyright (C) 2025, 2026 Maxim [maxirmx] Samsonov (www.sw.consulting)
// All rights reserved.
// This file is a part of twidisplay application

#pragma once

#include <string>

const std::string LOGGING_CONFIG_PATH = "config/logging.json";

#ifdef TWIDISPLAY_UNIX_FOLDER_CONVENTION
const std::string LOG_DIR = "/var/twidisplay/logs";
#else
const std::string LOG_DIR = "twidisplay/logs";
#endif
