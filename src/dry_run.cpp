#include "dry_run.h"
#include "protocol.h"

#include <ostream>
#include <utility>

class DryRunChannel : public HidChannel {
public:
    DryRunChannel(DryRunTransport& owner, std::string path)
        : _owner(owner), _path(std::move(path)) {}

    const std::string& path() const override { return _path; }

    int send_feature_report(const Bytes& report) override {
        _owner._out << format_hex_dump(report)
                    << "Length: " << report.size() << " bytes\n";
        _owner._frames.push_back({path(), report});
        return static_cast<int>(report.size());
    }

    Bytes get_feature_report(uint8_t, size_t) override {
        return {};
    }

private:
    DryRunTransport& _owner;
    std::string      _path;
};

DryRunTransport::DryRunTransport(std::ostream& out) : _out(out) {}

std::vector<HidInterfaceInfo> DryRunTransport::enumerate(uint16_t, uint16_t) {
    return {};
}

std::unique_ptr<HidChannel> DryRunTransport::open(const std::string& path) {
    return std::make_unique<DryRunChannel>(*this, path);
}
