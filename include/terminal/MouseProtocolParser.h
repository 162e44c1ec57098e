#pragma once

#include "core/Clock.h"
#include "core/Config.h"
#include "terminal/MouseEvent.h"
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace TerminalMouse::Terminal {

/**
 * @brief Raised when a sequence has the shape of a mouse report but a field
 *        cannot be decoded (numeric overflow, out-of-range legacy value)
 */
class MouseDecodeError : public std::runtime_error {
public:
    MouseDecodeError(const std::string& message, std::string sequence)
        : std::runtime_error(message)
        , m_sequence(std::move(sequence))
    {}

    const std::string& GetSequence() const { return m_sequence; }

private:
    std::string m_sequence;
};

/**
 * @brief Decodes terminal mouse reports into MouseEvent values
 *
 * Supported wire formats, tried in this order by Parse():
 * - SGR:    ESC [ < b ; x ; y M|m
 * - UTF-8:  ESC [ M Cb Cx Cy  (each value encoded as a UTF-8 character, +32)
 * - urxvt:  ESC [ b ; x ; y M
 * - Legacy: ESC [ M Cb Cx Cy  (raw bytes, decoded by the UTF-8 grammar)
 *
 * The parser holds no per-stream state; the only inputs besides the bytes
 * are the configured coordinate clamp and the clock used for timestamps.
 */
class MouseProtocolParser {
public:
    struct Extraction {
        std::vector<MouseEvent> events;   // In stream order
        std::string remainder;            // Input with every matched span removed
        int decodeFailures = 0;           // Spans dropped because they failed to decode
    };

    explicit MouseProtocolParser(Core::ParserConfig config = {},
                                 const Core::IClock& clock = Core::SteadyClock::Instance());

    /**
     * @brief Decode the first mouse report found in a sequence
     * @return The event, or nullopt if no grammar matches
     * @throws MouseDecodeError if a grammar matches but a field is malformed
     */
    std::optional<MouseEvent> Parse(std::string_view sequence) const;

    /**
     * @brief Decode every mouse report in a buffer, earliest first
     *
     * Decode failures are logged and their spans dropped; they never abort
     * the scan.
     */
    std::vector<MouseEvent> ExtractAll(std::string_view buffer) const;

    /**
     * @brief Like ExtractAll, but also returns the non-mouse bytes
     */
    Extraction Extract(std::string_view buffer) const;

    /**
     * @brief Check whether the buffer contains any mouse report or focus toggle
     */
    bool LooksLikeMouseSequence(std::string_view buffer) const;

    /**
     * @brief Length of a trailing fragment that could still grow into a mouse report
     *
     * Returns 0 when the buffer does not end inside a partial report.
     */
    std::size_t IncompleteSuffixLength(std::string_view buffer) const;

    /**
     * @brief Convert 1-based terminal coordinates to 0-based cell coordinates
     */
    MouseCoordinates MapCoordinates(int x, int y) const;

    // Printable rendering of control bytes for log output
    static std::string Escape(std::string_view sequence);

private:
    enum class Format { Sgr, Utf8, Urxvt };

    struct Match {
        std::size_t start = 0;
        std::size_t length = 0;
        Format format = Format::Sgr;
    };

    static std::size_t MatchSgr(std::string_view buffer, std::size_t pos);
    static std::size_t MatchUtf8(std::string_view buffer, std::size_t pos);
    static std::size_t MatchUrxvt(std::string_view buffer, std::size_t pos);
    static std::size_t MatchFormat(Format format, std::string_view buffer, std::size_t pos);
    static std::optional<Match> FindFirst(Format format, std::string_view buffer);
    static std::optional<Match> FindEarliest(std::string_view buffer, std::size_t from);
    static bool IsPartialReport(std::string_view tail);

    MouseEvent Decode(const Match& match, std::string_view buffer) const;
    MouseEvent DecodeNumeric(std::string_view raw, bool sgr) const;
    MouseEvent DecodeUtf8(std::string_view raw) const;
    MouseEvent BuildEvent(int code, int x, int y, bool sgr, bool release, std::string_view raw) const;

    Core::ParserConfig m_config;
    const Core::IClock& m_clock;
};

} // namespace TerminalMouse::Terminal
