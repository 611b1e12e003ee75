/*
 * id3peek.h - main include for all other source files.
 * This file is part of ID3Peek.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef __ID3PEEK_H__
#define __ID3PEEK_H__

#ifdef HAVE_CONFIG_H
#include "config.h"
#endif

#ifndef ID3PEEK_VERSION
#define ID3PEEK_VERSION "1-CURRENT"
#endif
#define ID3PEEK_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <exception>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include "debug.h"
#include "exceptions.h"

#include "core/utility/UTF8Util.h"
#include "core/compression/Decompressor.h"
#include "core/compression/ZlibDecompressor.h"

#include "io/IOHandler.h"
#include "io/MemoryIOHandler.h"
#include "io/file/FileIOHandler.h"

#include "tag/TagConstants.h"
#include "tag/Tag.h"
#include "tag/ImageUtils.h"
#include "tag/ID3v2Utils.h"
#include "tag/ID3v1Tag.h"
#include "tag/ID3v2Frame.h"
#include "tag/ID3v2FrameLayout.h"
#include "tag/ID3v2FrameDecoder.h"
#include "tag/ID3v2Tag.h"
#include "tag/Metadata.h"
#include "tag/TagAggregator.h"
#include "tag/TagReader.h"

#endif // __ID3PEEK_H__
