/*
 * TagAggregator.h - Merge ID3v1 and ID3v2 into one Metadata view
 * This file is part of ID3Peek.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * ID3Peek is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef ID3PEEK_TAG_TAGAGGREGATOR_H
#define ID3PEEK_TAG_TAGAGGREGATOR_H

#include "tag/Metadata.h"

namespace ID3Peek {
namespace Tag {

class ID3v1Tag;
class ID3v2Tag;

/**
 * @brief Combines the tags of one file
 * 
 * For each common field the ID3v2 value wins when present and non-empty,
 * then the ID3v1 value. Either tag may be null.
 */
class TagAggregator {
public:
    static Metadata aggregate(const ID3v1Tag* v1, const ID3v2Tag* v2);
};

} // namespace Tag
} // namespace ID3Peek

#endif // ID3PEEK_TAG_TAGAGGREGATOR_H
