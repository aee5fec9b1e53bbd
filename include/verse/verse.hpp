#pragma once


/*
    -----
    Verse
    -----
    Converts generic value trees (typically decoded JSON) into strongly-typed
    C++ values. Target types describe their record fields with
    `Verse::fields<T>` and take part in their own conversion through hooks.

    - `verse/value.hpp`     generic value tree
    - `verse/error.hpp`     ConvertError, ReadError, status, reject
    - `verse/options.hpp`   ConvertOptions, ReadOptions, WriteOptions
    - `verse/describe.hpp`  shapes, field tables, VERSE_FIELD
    - `verse/hooks.hpp`     conversion hook concepts
    - `verse/convert.hpp`   Verse::parse
    - `verse/json.hpp`      Verse::read, Verse::dump, Verse::parse_json
    - `verse/log.hpp`       library logger
*/

#include "verse/config.hpp"
#include "verse/value.hpp"
#include "verse/error.hpp"
#include "verse/options.hpp"
#include "verse/log.hpp"
#include "verse/describe.hpp"
#include "verse/hooks.hpp"
#include "verse/convert.hpp"
#include "verse/json.hpp"
