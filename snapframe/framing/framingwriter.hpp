// snapframe/framing/framingwriter.hpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "snapframe/framing/framingencoder.hpp"

namespace snapframe {
namespace framing {

//! Encoder front-end accumulating small writes into full blocks
class Writer : NonCopyable {
public:
    using StateE = Encoder::StateE;

    explicit Writer(
        OutputChannel*       _pchannel = nullptr,
        const Configuration& _rcfg     = Configuration());

    size_t write(const char* _pbuf, size_t _bufsz, ErrorConditionT& _rerror);

    //! Encode the accumulated partial block
    ErrorConditionT flush();

    ErrorConditionT close();

    void reset(OutputChannel* _pchannel);

    //! Consume _rsource to its end; returns the number of bytes taken
    /*!
        A source error is returned through _rerror and latches the writer in
        StateE::Failed. Otherwise the last partial block stays buffered.
    */
    uint64_t readFrom(InputChannel& _rsource, ErrorConditionT& _rerror);

    StateE state() const
    {
        return encoder_.state();
    }

    const ErrorConditionT& error() const
    {
        return encoder_.error();
    }

    size_t bufferedSize() const
    {
        return buffered_;
    }

    const Encoder& encoder() const
    {
        return encoder_;
    }

private:
    bool doFlush(ErrorConditionT& _rerror);

private:
    Encoder           encoder_;
    std::vector<char> buf_;
    size_t            buffered_;
};

} // namespace framing
} // namespace snapframe
