// snapframe/framing/framingchannel.hpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "snapframe/system/error.hpp"
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace snapframe {
namespace framing {

//! Synchronous source of bytes
struct InputChannel {
    virtual ~InputChannel();

    //! Returns the number of bytes read; 0 without error means end of input
    virtual size_t read(char* _pbuf, size_t _bufsz, ErrorConditionT& _rerror) = 0;
};

//! Synchronous sink of bytes
struct OutputChannel {
    virtual ~OutputChannel();

    //! Returns the number of bytes accepted; fewer than _bufsz must come with _rerror set
    virtual size_t write(const char* _pbuf, size_t _bufsz, ErrorConditionT& _rerror) = 0;
};

class IStreamChannel : public InputChannel {
    std::istream& ris_;

public:
    IStreamChannel(std::istream& _ris)
        : ris_(_ris)
    {
    }

    size_t read(char* _pbuf, size_t _bufsz, ErrorConditionT& _rerror) override;
};

class OStreamChannel : public OutputChannel {
    std::ostream& ros_;

public:
    OStreamChannel(std::ostream& _ros)
        : ros_(_ros)
    {
    }

    size_t write(const char* _pbuf, size_t _bufsz, ErrorConditionT& _rerror) override;
};

class StringInputChannel : public InputChannel {
    std::string_view data_;
    size_t           offset_ = 0;

public:
    StringInputChannel(std::string_view _data = std::string_view())
        : data_(_data)
    {
    }

    void reset(std::string_view _data)
    {
        data_   = _data;
        offset_ = 0;
    }

    size_t offset() const
    {
        return offset_;
    }

    size_t read(char* _pbuf, size_t _bufsz, ErrorConditionT& _rerror) override;
};

class StringOutputChannel : public OutputChannel {
    std::string& rstr_;

public:
    StringOutputChannel(std::string& _rstr)
        : rstr_(_rstr)
    {
    }

    const std::string& str() const
    {
        return rstr_;
    }

    size_t write(const char* _pbuf, size_t _bufsz, ErrorConditionT& _rerror) override;
};

} // namespace framing
} // namespace snapframe
