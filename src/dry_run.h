#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "hid.h"

// A frame the dry-run transport was asked to send
struct RecordedFrame {
    std::string path;
    Bytes       bytes;
};

// HidTransport that never touches the host. Sent feature reports are
// printed as a hex dump plus length and recorded; feature-report reads
// return nothing. Enumeration is empty, so callers skip resolution and
// open channels under placeholder names.
class DryRunTransport : public HidTransport {
public:
    explicit DryRunTransport(std::ostream& out);

    std::vector<HidInterfaceInfo> enumerate(uint16_t vid, uint16_t pid) override;
    std::unique_ptr<HidChannel> open(const std::string& path) override;

    // Every frame sent through any channel of this transport, in order
    const std::vector<RecordedFrame>& frames() const { return _frames; }

private:
    friend class DryRunChannel;

    std::ostream&              _out;
    std::vector<RecordedFrame> _frames;
};
