#pragma once

/**
 * @file slip.hpp
 * @brief SLIP (RFC 1055) framing for the radio link: one JSON document per frame.
 *
 * @details
 * OVERVIEW
 * --------
 * The link to a radio bridge is a plain byte stream (USB CDC serial or TCP).
 * SLIP marks document boundaries on it; boot chatter printed by a freshly
 * reset board before the first END never reaches the JSON parser.
 *
 *   END 0xC0   ESC 0xDB   ESC_END 0xDC   ESC_ESC 0xDD
 *
 * Outgoing frames are END payload END. FrameReader hunts for the first END,
 * treats every later END as "close this frame, open the next", skips empty
 * frames, and falls back to hunting on a malformed escape.
 *
 * EXAMPLE
 * -------
 * @code
 *   auto wire = meshlink::slip::framed(std::string("{\"op\":\"get_state\"}"));
 *
 *   meshlink::slip::FrameReader reader;
 *   reader.push_all(wire.data(), wire.size(),
 *                   [](std::vector<uint8_t> doc) { handle(doc); });
 * @endcode
 *
 * @note Framing only. Integrity is the business of the document layer above.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace meshlink {
namespace slip {

static constexpr uint8_t END     = 0xC0;
static constexpr uint8_t ESC     = 0xDB;
static constexpr uint8_t ESC_END = 0xDC;
static constexpr uint8_t ESC_ESC = 0xDD;

/// Second byte of the escape pair for @p b, or 0 when @p b travels as-is.
constexpr uint8_t escape_code(uint8_t b) {
    return b == END ? ESC_END : (b == ESC ? ESC_ESC : 0);
}

/// Inverse of escape_code(); nullopt for a byte that is not a valid escape.
constexpr std::optional<uint8_t> unescape(uint8_t code) {
    if (code == ESC_END) return END;
    if (code == ESC_ESC) return ESC;
    return std::nullopt;
}

/// Wire bytes for one frame: END, escaped payload, END.
inline std::vector<uint8_t> framed(const uint8_t* data, size_t n) {
    std::vector<uint8_t> wire;
    wire.reserve(n + n / 8 + 2);
    wire.push_back(END);
    for (const uint8_t* p = data; p != data + n; ++p) {
        if (const uint8_t code = escape_code(*p)) {
            wire.push_back(ESC);
            wire.push_back(code);
        } else {
            wire.push_back(*p);
        }
    }
    wire.push_back(END);
    return wire;
}

inline std::vector<uint8_t> framed(const std::string& text) {
    return framed(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

/**
 * @brief Incremental frame reader.
 *
 *   Hunting --END--> Body --ESC--> Escaped --valid code--> Body
 *   Body --END--> Body (emits the payload when non-empty)
 *   Escaped --bad code--> Hunting (partial payload discarded)
 */
class FrameReader {
public:
    enum class State { Hunting, Body, Escaped };

    /// Consume one byte; returns the payload it completes, if any.
    std::optional<std::vector<uint8_t>> push(uint8_t b) {
        switch (state_) {
            case State::Hunting:
                if (b == END) start();
                return std::nullopt;

            case State::Escaped:
                if (auto lit = unescape(b)) {
                    payload_.push_back(*lit);
                    state_ = State::Body;
                } else {
                    payload_.clear();
                    state_ = State::Hunting;
                }
                return std::nullopt;

            case State::Body:
                break;
        }

        if (b == ESC) {
            state_ = State::Escaped;
            return std::nullopt;
        }
        if (b != END) {
            payload_.push_back(b);
            return std::nullopt;
        }
        // END closes the current frame and opens the next one.
        if (payload_.empty()) return std::nullopt;
        std::vector<uint8_t> done;
        done.swap(payload_);
        return done;
    }

    /// Feed a buffer; @p on_frame is called once per completed payload.
    template <typename OnFrame>
    void push_all(const uint8_t* data, size_t n, OnFrame&& on_frame) {
        for (size_t i = 0; i < n; ++i) {
            if (auto f = push(data[i])) on_frame(std::move(*f));
        }
    }

    State state() const { return state_; }

    void reset() {
        payload_.clear();
        state_ = State::Hunting;
    }

private:
    void start() {
        payload_.clear();
        state_ = State::Body;
    }

    State                state_{State::Hunting};
    std::vector<uint8_t> payload_;
};

} // namespace slip
} // namespace meshlink
