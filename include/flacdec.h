/*
 * flacdec.h - main include for all other source files.
 * This file is part of flacdec.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * flacdec is free software. You may redistribute and/or modify it under
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

#ifndef __FLACDEC_H__
#define __FLACDEC_H__

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#ifndef FLACDEC_VERSION
#define FLACDEC_VERSION "1-CURRENT"
#endif
#define FLACDEC_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

//
// C++ Standard Library
#include <algorithm>
#include <array>
#include <atomic>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <sstream>
#include <unordered_set>
#include <vector>
#include <chrono>
#include <limits>

// C Standard Library (wrapped)
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// System-specific headers
#include <sys/types.h>

// OpenSSL (stream signature)
#include <openssl/evp.h>

// Debug output
#include "debug.h"

// Byte sources
#include "io/IOHandler.h"
#include "io/MemoryIOHandler.h"

// FLAC decode engine
#include "codecs/flac/FLACError.h"
#include "codecs/flac/FLACTypes.h"
#include "codecs/flac/CRCValidator.h"
#include "codecs/flac/BitstreamReader.h"
#include "codecs/flac/MetadataParser.h"
#include "codecs/flac/FrameParser.h"
#include "codecs/flac/ResidualDecoder.h"
#include "codecs/flac/SampleReconstructor.h"
#include "codecs/flac/SubframeDecoder.h"
#include "codecs/flac/ChannelDecorrelator.h"
#include "codecs/flac/MD5Validator.h"
#include "codecs/flac/FrameAssembler.h"
#include "codecs/flac/DecodeSession.h"

#endif // __FLACDEC_H__
