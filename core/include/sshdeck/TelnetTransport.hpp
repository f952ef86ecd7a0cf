// Transport implementation for Telnet hosts over a plain TCP socket.
// No authentication happens here: login prompts travel in the byte stream.
#pragma once
#include "Transport.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace sshdeck {

namespace telnet {
class TelnetCodec;
}

class TelnetTransport : public Transport {
public:
    TelnetTransport();
    ~TelnetTransport() override;

    bool connect(const HostDescriptor& host,
                 const TransportOptions& opt,
                 Error& err) override;
    bool requiresAuthentication() const override { return false; }
    bool authenticate(const HostDescriptor& host,
                      const Secret& secret,
                      const TransportOptions& opt,
                      Error& err) override;
    bool openShell(const TransportOptions& opt, Error& err) override;
    bool isConnected() const override { return connected_.load(); }

    long read(char* buf, std::size_t cap,
              std::chrono::milliseconds timeout,
              Error& err) override;
    bool write(const char* data, std::size_t len, Error& err) override;

    bool supportsResize() const override { return true; }
    bool resize(int rows, int cols, Error& err) override;

    bool supportsSftp() const override { return false; }
    std::unique_ptr<SftpChannel> openSftp(Error& err) override;

    void abort() override;
    void close() override;

private:
    bool sendAll(const std::string& bytes, Error& err);  // requires mtx_

    std::mutex mtx_;   // codec state and socket writes
    std::unique_ptr<telnet::TelnetCodec> codec_;
    std::atomic<int>  sock_{-1};
    std::atomic<bool> aborted_{false};
    std::atomic<bool> connected_{false};
    std::string pending_;   // decoded bytes not yet handed to read()
    std::string hostId_;
};

} // namespace sshdeck
