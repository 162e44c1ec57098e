#include "terminal/MouseProtocolParser.h"
#include "terminal/MouseSequences.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <cstdio>

namespace TerminalMouse::Terminal {

namespace {

constexpr char kEsc = '\x1b';

struct DecodedChar {
    int value = 0;
    std::size_t length = 0;
};

bool IsDigit(char c) {
    return c >= '0' && c <= '9';
}

// Decode one character of a UTF-8 mode report. Bytes that do not start a
// complete, well-formed UTF-8 sequence are taken as single raw bytes, which
// is how the legacy X10 encoding arrives.
std::optional<DecodedChar> NextChar(std::string_view buffer, std::size_t pos) {
    if (pos >= buffer.size()) {
        return std::nullopt;
    }
    auto lead = static_cast<unsigned char>(buffer[pos]);
    std::size_t length = 1;
    int value = lead;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        value = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        value = lead & 0x0F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        value = lead & 0x07;
    }
    if (length == 1 || pos + length > buffer.size()) {
        return DecodedChar{lead, 1};
    }
    for (std::size_t i = 1; i < length; ++i) {
        auto cont = static_cast<unsigned char>(buffer[pos + i]);
        if ((cont & 0xC0) != 0x80) {
            return DecodedChar{lead, 1};
        }
        value = (value << 6) | (cont & 0x3F);
    }
    return DecodedChar{value, length};
}

// The three payload characters of an "ESC [ M" report and the bytes they span
struct LegacyPayload {
    int values[3] = {0, 0, 0};
    std::size_t length = 0;
    bool inRange = false;
};

bool PayloadInRange(const LegacyPayload& payload) {
    const int code = payload.values[0];
    const int x = payload.values[1];
    const int y = payload.values[2];
    return code >= 0 && x >= 1 && y >= 1 &&
           x <= Sequences::kLegacyMaxCoordinate && y <= Sequences::kLegacyMaxCoordinate;
}

// Read the payload starting at pos (just after "ESC [ M"). The UTF-8 reading
// is tried first; when it runs short, reaches an ESC or decodes out of range,
// the three bytes are read raw as X10 sends them. An ESC is never payload, so
// a damaged report cannot swallow the report that follows it.
std::optional<LegacyPayload> ReadLegacyPayload(std::string_view buffer, std::size_t pos) {
    std::optional<LegacyPayload> utf8 = LegacyPayload{};
    std::size_t cursor = pos;
    for (int i = 0; i < 3 && utf8; ++i) {
        auto ch = NextChar(buffer, cursor);
        if (!ch || (ch->length == 1 && buffer[cursor] == kEsc)) {
            utf8.reset();
            break;
        }
        utf8->values[i] = ch->value - Sequences::kLegacyOffset;
        cursor += ch->length;
    }
    if (utf8) {
        utf8->length = cursor - pos;
        utf8->inRange = PayloadInRange(*utf8);
        if (utf8->inRange) {
            return utf8;
        }
    }

    std::optional<LegacyPayload> raw;
    if (pos + 3 <= buffer.size() &&
        buffer.substr(pos, 3).find(kEsc) == std::string_view::npos) {
        raw = LegacyPayload{};
        for (int i = 0; i < 3; ++i) {
            raw->values[i] = static_cast<unsigned char>(buffer[pos + i]) - Sequences::kLegacyOffset;
        }
        raw->length = 3;
        raw->inRange = PayloadInRange(*raw);
        if (raw->inRange) {
            return raw;
        }
    }
    return utf8 ? utf8 : raw;
}

// Consume a run of digits; returns the position after it, or npos if empty
std::size_t SkipDigits(std::string_view buffer, std::size_t pos) {
    std::size_t start = pos;
    while (pos < buffer.size() && IsDigit(buffer[pos])) {
        ++pos;
    }
    return pos == start ? std::string_view::npos : pos;
}

// Match "d+;d+;d+" starting at pos; returns the position after the last digit
std::size_t SkipTriple(std::string_view buffer, std::size_t pos) {
    for (int field = 0; field < 3; ++field) {
        pos = SkipDigits(buffer, pos);
        if (pos == std::string_view::npos) {
            return pos;
        }
        if (field < 2) {
            if (pos >= buffer.size() || buffer[pos] != ';') {
                return std::string_view::npos;
            }
            ++pos;
        }
    }
    return pos;
}

// True if text is a non-empty prefix of "d+;d+;d+" (digits and separators only)
bool IsTriplePrefix(std::string_view text) {
    int separators = 0;
    bool needDigit = true;
    for (char c : text) {
        if (IsDigit(c)) {
            needDigit = false;
        } else if (c == ';' && !needDigit && separators < 2) {
            ++separators;
            needDigit = true;
        } else {
            return false;
        }
    }
    return true;
}

int ParseField(std::string_view field, std::string_view raw) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec == std::errc::result_out_of_range) {
        throw MouseDecodeError("Numeric field out of range: " + std::string(field), std::string(raw));
    }
    if (ec != std::errc() || ptr != field.data() + field.size()) {
        throw MouseDecodeError("Malformed numeric field: " + std::string(field), std::string(raw));
    }
    return value;
}

} // namespace

MouseProtocolParser::MouseProtocolParser(Core::ParserConfig config, const Core::IClock& clock)
    : m_config(config)
    , m_clock(clock)
{
}

// ============================================================================
// Grammar matching
// ============================================================================

std::size_t MouseProtocolParser::MatchSgr(std::string_view buffer, std::size_t pos) {
    if (buffer.compare(pos, 3, "\x1b[<") != 0) {
        return 0;
    }
    std::size_t end = SkipTriple(buffer, pos + 3);
    if (end == std::string_view::npos || end >= buffer.size()) {
        return 0;
    }
    if (buffer[end] != 'M' && buffer[end] != 'm') {
        return 0;
    }
    return end + 1 - pos;
}

std::size_t MouseProtocolParser::MatchUtf8(std::string_view buffer, std::size_t pos) {
    if (buffer.compare(pos, 3, "\x1b[M") != 0) {
        return 0;
    }
    auto payload = ReadLegacyPayload(buffer, pos + 3);
    return payload ? 3 + payload->length : 0;
}

std::size_t MouseProtocolParser::MatchUrxvt(std::string_view buffer, std::size_t pos) {
    if (buffer.compare(pos, 2, "\x1b[") != 0) {
        return 0;
    }
    std::size_t end = SkipTriple(buffer, pos + 2);
    if (end == std::string_view::npos || end >= buffer.size() || buffer[end] != 'M') {
        return 0;
    }
    return end + 1 - pos;
}

std::size_t MouseProtocolParser::MatchFormat(Format format, std::string_view buffer, std::size_t pos) {
    switch (format) {
        case Format::Sgr:   return MatchSgr(buffer, pos);
        case Format::Utf8:  return MatchUtf8(buffer, pos);
        case Format::Urxvt: return MatchUrxvt(buffer, pos);
    }
    return 0;
}

std::optional<MouseProtocolParser::Match> MouseProtocolParser::FindFirst(Format format,
                                                                         std::string_view buffer) {
    for (std::size_t pos = buffer.find(kEsc); pos != std::string_view::npos;
         pos = buffer.find(kEsc, pos + 1)) {
        if (std::size_t length = MatchFormat(format, buffer, pos)) {
            return Match{pos, length, format};
        }
    }
    return std::nullopt;
}

std::optional<MouseProtocolParser::Match> MouseProtocolParser::FindEarliest(std::string_view buffer,
                                                                            std::size_t from) {
    // The three grammars differ in their third byte, so at most one matches
    // at any position and the first position that matches wins.
    for (std::size_t pos = buffer.find(kEsc, from); pos != std::string_view::npos;
         pos = buffer.find(kEsc, pos + 1)) {
        for (Format format : {Format::Sgr, Format::Utf8, Format::Urxvt}) {
            if (std::size_t length = MatchFormat(format, buffer, pos)) {
                return Match{pos, length, format};
            }
        }
    }
    return std::nullopt;
}

// ============================================================================
// Decoding
// ============================================================================

MouseCoordinates MouseProtocolParser::MapCoordinates(int x, int y) const {
    return MouseCoordinates{
        std::min(std::max(0, x - 1), m_config.maxCoordinate),
        std::min(std::max(0, y - 1), m_config.maxCoordinate)
    };
}

MouseEvent MouseProtocolParser::BuildEvent(int code, int x, int y, bool sgr, bool release,
                                           std::string_view raw) const {
    MouseEvent event;
    event.coordinates = MapCoordinates(x, y);
    event.timestamp = m_clock.Now();
    event.rawSequence = std::string(raw);

    event.modifiers.shift = (code & Sequences::kShiftBit) != 0;
    event.modifiers.alt = (code & Sequences::kAltBit) != 0;
    event.modifiers.ctrl = (code & Sequences::kCtrlBit) != 0;

    const int baseButton = code & 3;
    if (code & Sequences::kWheelBit) {
        event.button = (code & 1) ? MouseButton::ScrollDown : MouseButton::ScrollUp;
        event.type = MouseEventType::Scroll;
        return event;
    }

    switch (baseButton) {
        case 1:  event.button = MouseButton::Middle; break;
        case 2:  event.button = MouseButton::Right; break;
        default: event.button = MouseButton::Left; break;
    }

    if (baseButton == 3 || (code & Sequences::kMotionBit)) {
        event.type = MouseEventType::Move;
    } else if (sgr && release) {
        event.type = MouseEventType::DragEnd;
    } else {
        event.type = MouseEventType::Click;
    }
    return event;
}

MouseEvent MouseProtocolParser::DecodeNumeric(std::string_view raw, bool sgr) const {
    // Skip "ESC[<" or "ESC[" and drop the final action byte
    std::string_view fields = raw.substr(sgr ? 3 : 2, raw.size() - (sgr ? 4 : 3));
    int values[3] = {0, 0, 0};
    for (int i = 0; i < 3; ++i) {
        std::size_t separator = fields.find(';');
        values[i] = ParseField(fields.substr(0, separator), raw);
        fields = separator == std::string_view::npos ? std::string_view() : fields.substr(separator + 1);
    }
    return BuildEvent(values[0], values[1], values[2], sgr, raw.back() == 'm', raw);
}

MouseEvent MouseProtocolParser::DecodeUtf8(std::string_view raw) const {
    auto payload = ReadLegacyPayload(raw, 3);
    if (!payload) {
        throw MouseDecodeError("Truncated UTF-8 mouse report", std::string(raw));
    }

    const int code = payload->values[0];
    const int x = payload->values[1];
    const int y = payload->values[2];
    if (!payload->inRange) {
        throw MouseDecodeError("UTF-8 mouse report out of range: button=" + std::to_string(code) +
                               " x=" + std::to_string(x) + " y=" + std::to_string(y),
                               std::string(raw));
    }
    return BuildEvent(code, x, y, false, false, raw);
}

MouseEvent MouseProtocolParser::Decode(const Match& match, std::string_view buffer) const {
    std::string_view raw = buffer.substr(match.start, match.length);
    switch (match.format) {
        case Format::Sgr:   return DecodeNumeric(raw, true);
        case Format::Utf8:  return DecodeUtf8(raw);
        case Format::Urxvt: return DecodeNumeric(raw, false);
    }
    throw MouseDecodeError("Unknown report format", std::string(raw));
}

// ============================================================================
// Public API
// ============================================================================

std::optional<MouseEvent> MouseProtocolParser::Parse(std::string_view sequence) const {
    // Legacy reports share the UTF-8 grammar, so three passes cover all four formats
    for (Format format : {Format::Sgr, Format::Utf8, Format::Urxvt}) {
        if (auto match = FindFirst(format, sequence)) {
            return Decode(*match, sequence);
        }
    }
    spdlog::trace("Not a mouse sequence: {}", Escape(sequence));
    return std::nullopt;
}

MouseProtocolParser::Extraction MouseProtocolParser::Extract(std::string_view buffer) const {
    Extraction result;
    std::size_t pos = 0;
    while (auto match = FindEarliest(buffer, pos)) {
        result.remainder.append(buffer.substr(pos, match->start - pos));
        try {
            result.events.push_back(Decode(*match, buffer));
        } catch (const MouseDecodeError& e) {
            ++result.decodeFailures;
            spdlog::debug("Dropped mouse report {}: {}", Escape(e.GetSequence()), e.what());
        }
        pos = match->start + match->length;
    }
    result.remainder.append(buffer.substr(pos));
    return result;
}

std::vector<MouseEvent> MouseProtocolParser::ExtractAll(std::string_view buffer) const {
    return Extract(buffer).events;
}

bool MouseProtocolParser::LooksLikeMouseSequence(std::string_view buffer) const {
    if (FindEarliest(buffer, 0)) {
        return true;
    }
    return buffer.find(Sequences::kEnableFocusEvents) != std::string_view::npos ||
           buffer.find(Sequences::kDisableFocusEvents) != std::string_view::npos;
}

bool MouseProtocolParser::IsPartialReport(std::string_view tail) {
    // tail starts with ESC and is known not to be a complete report. A lone
    // ESC is almost always the Escape key, so only "ESC [" onwards counts.
    if (tail.size() < 2 || tail[1] != '[') {
        return false;
    }
    std::string_view body = tail.substr(2);
    if (body.empty()) {
        return true;
    }
    if (body[0] == '<') {
        return IsTriplePrefix(body.substr(1));
    }
    if (body[0] == 'M') {
        // Fewer than three payload characters so far
        std::size_t cursor = 3;
        int count = 0;
        while (auto ch = NextChar(tail, cursor)) {
            cursor += ch->length;
            ++count;
        }
        return count < 3;
    }
    return IsTriplePrefix(body);
}

std::size_t MouseProtocolParser::IncompleteSuffixLength(std::string_view buffer) const {
    // A partial report is never longer than this; digit runs beyond it are not mouse input
    constexpr std::size_t kMaxPartialLength = 32;
    std::size_t from = buffer.size() > kMaxPartialLength ? buffer.size() - kMaxPartialLength : 0;
    for (std::size_t pos = buffer.find(kEsc, from); pos != std::string_view::npos;
         pos = buffer.find(kEsc, pos + 1)) {
        std::string_view tail = buffer.substr(pos);
        if (FindEarliest(tail, 0)) {
            continue;
        }
        if (IsPartialReport(tail)) {
            return tail.size();
        }
    }
    return 0;
}

std::string MouseProtocolParser::Escape(std::string_view sequence) {
    std::string out;
    out.reserve(sequence.size() * 2);
    for (char c : sequence) {
        auto byte = static_cast<unsigned char>(c);
        if (byte == 0x1b) {
            out += "\\x1b";
        } else if (byte < 0x20 || byte == 0x7f) {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "\\x%02x", byte);
            out += hex;
        } else {
            out += c;
        }
    }
    return out;
}

} // namespace TerminalMouse::Terminal
