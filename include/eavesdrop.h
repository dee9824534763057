/*
 * eavesdrop.h - main include for all other source files.
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef __EAVESDROP_H__
#define __EAVESDROP_H__

#include <cstdint>
#include <ostream>

// defines
#define EAVESDROP_VERSION "1-CURRENT"
#define EAVESDROP_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

//
// C++ Standard Library
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// C Standard Library (wrapped)
#include <cerrno>
#include <cmath>
#include <csignal>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// System-specific headers
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

// cURL library
#include <curl/curl.h>

// JSON
#include <nlohmann/json.hpp>

// Local project headers (in dependency order where possible)
#include "debug.h"
#include "core/exceptions.h"
#include "core/utility/Base64.h"
#include "core/Config.h"

// I/O Handler subsystem
#include "io/RAIIFileHandle.h"
#include "io/IOHandler.h"
#include "io/file/FileIOHandler.h"
#include "io/MemoryIOHandler.h"
#include "io/WavReader.h"
#include "io/http/HTTPClient.h"

// Frame-addressed sequence data
#include "fseq/FseqHeader.h"
#include "fseq/FseqFile.h"
#include "fseq/FseqWriter.h"
#include "fseq/AudioFrame.h"
#include "fseq/CompanionLocator.h"

// Show-playback daemon interfaces
#include "fpp/PlaybackStatus.h"
#include "fpp/FPPStatusClient.h"
#include "fpp/FPPCommandClient.h"

// Position synchronization
#include "sync/DriftModel.h"
#include "sync/PositionCell.h"
#include "sync/SyncEstimator.h"

// Playback client driver
#include "player/CadenceLoop.h"
#include "player/EventStream.h"
#include "player/PlaybackDriver.h"
#include "player/FrameStreamer.h"

#endif // __EAVESDROP_H__
