#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <telnet/channel.hpp>

// Replays a canned conversation: `banner` arrives right after the channel
// opens, replies[i] arrives after the i-th send. Everything the client does
// is recorded for the test to inspect.
struct ScriptedTranscript {
    std::string banner;
    std::vector<std::string> replies;
    size_t chunk_size = 0;              // 0 delivers everything pending at once
    bool eof_when_exhausted = false;    // report a closed stream once drained

    std::vector<std::string> sent;
    bool closed = false;
    int opens = 0;
};

class ScriptedChannel : public Channel {
public:
    explicit ScriptedChannel(std::shared_ptr<ScriptedTranscript> t)
        : t_(std::move(t)), pending_(t_->banner) {}

    Result<void> send(const std::string& text) override {
        if (!open_) return Result<void>::Err("Channel is closed");
        t_->sent.push_back(text);
        if (next_reply_ < t_->replies.size()) {
            pending_ += t_->replies[next_reply_++];
        }
        return Result<void>::Ok();
    }

    Result<std::string> read_available(std::chrono::milliseconds wait) override {
        if (!open_) return Result<std::string>::Err("Channel is closed");
        if (pending_.empty()) {
            if (t_->eof_when_exhausted && next_reply_ >= t_->replies.size()) {
                return Result<std::string>::Err("Connection closed by remote host");
            }
            std::this_thread::sleep_for(std::min(wait, std::chrono::milliseconds(2)));
            return Result<std::string>::Ok("");
        }
        size_t n = t_->chunk_size == 0 ? pending_.size() : std::min(t_->chunk_size, pending_.size());
        std::string chunk = pending_.substr(0, n);
        pending_.erase(0, n);
        return Result<std::string>::Ok(chunk);
    }

    void close() override {
        open_ = false;
        t_->closed = true;
    }

    bool is_open() const override { return open_; }

private:
    std::shared_ptr<ScriptedTranscript> t_;
    std::string pending_;
    size_t next_reply_ = 0;
    bool open_ = true;
};

inline ChannelOpener scripted_opener(std::shared_ptr<ScriptedTranscript> t) {
    return [t](const std::string&, int, std::chrono::seconds) -> Result<ChannelPtr> {
        t->opens++;
        return Result<ChannelPtr>::Ok(std::make_unique<ScriptedChannel>(t));
    };
}

// ── HORIZONS transcript fragments ──────────────────────────

namespace transcript {

inline const std::string BANNER =
    "\r\n ======================================================================\r\n"
    " |                    Jet Propulsion Laboratory                        |\r\n"
    " ======================================================================\r\n"
    "\r\n"
    "Horizons> ";

inline const std::string PAGE_OFF = "\r\n Paging is OFF\r\n\r\nHorizons> ";

inline const std::string SELECT =
    "\r\n*******************************************************************************\r\n"
    " JPL/HORIZONS                   (2015 HM10)             2018-Jan-21 07:00:00\r\n"
    "*******************************************************************************\r\n"
    " Select ... [A]pproaches, [E]phemeris, [F]tp,[M]ail,[R]edisplay, [S]PK,?,<cr>: ";

inline const std::string CONTINUE =
    "\r\n>EXACT< designation search [CASE & SPACE sensitive]:\r\n"
    " Continue [ <cr>=yes, n=no, ? ] : ";

inline const std::string EPHEMERIS_TYPE = "\r\n Observe, Elements, Vectors  [o,e,v,?] : ";
inline const std::string CENTER = "\r\n Coordinate center [ <id>,coord,geo  ] : ";
inline const std::string STARTING = "\r\n Starting UT  [ <cr>=2018-Jan-21 07:00 ] : ";
inline const std::string ENDING = "\r\n Ending   UT  [ <cr>=2018-Feb-20 07:00 ] : ";
inline const std::string INTERVAL = "\r\n Output interval [ex: 10m, 1h, 1d, ? ] : ";
inline const std::string ACCEPT = "\r\n Accept default output [ cr=(y), n, ?] : ";
inline const std::string QUANTITIES = "\r\n Select table quantities [ <#,#..>, ?] : ";

inline const std::string ROWS =
    " 2018-Jan-01 10:00     8.33028\r\n"
    " 2018-Jan-08 10:00     8.31015";

inline std::string table(const std::string& rows = ROWS) {
    return "\r\n Date__(UT)__HR:MN          1-way_LT\r\n"
           "***************************************\r\n"
           "$$SOE\r\n" + rows + "\r\n$$EOE\r\n"
           "***************************************\r\n"
           ">>> Select... [A]gain, [N]ew-case, [F]tp, [K]ermit, [M]ail, [R]edisplay, ? : ";
}

inline const std::string CANDIDATES =
    "  99942    Apophis (alt)                                   2004 MN4\r\n"
    "  20099942 Apophis                                         2004 MN4";

inline const std::string MULTIPLE =
    "\r\n Multiple major-bodies match string \"APOPHIS*\"\r\n"
    "\r\n"
    "  ID#      Name                               Designation  IAU/aliases/other   \r\n"
    "  -------  ---------------------------------- -----------  ------------------- \r\n"
    + CANDIDATES + "\r\n"
    "\r\n"
    "   Number of matches =   2. Use ID# to make unique selection.\r\n"
    "\r\nHorizons> ";

inline const std::string NO_MATCHES = "\r\n No matches found.\r\n\r\nHorizons> ";

inline const std::string DISALLOWED =
    "\r\n Observer and target are the same body: center disallowed.\r\n";

// Replies after the target for a straight run to the table.
inline std::vector<std::string> after_select() {
    return {EPHEMERIS_TYPE, CENTER, STARTING, ENDING, INTERVAL, ACCEPT, QUANTITIES, table(), ""};
}

} // namespace transcript
