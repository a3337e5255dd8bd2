#include "transport/remote_shell_transport.hpp"
#include "common/logger.hpp"
#include <libssh/libssh.h>
#include <chrono>

namespace {

// Owns an ssh_session; disconnects and frees it on every exit path
class SshSessionGuard {
public:
    SshSessionGuard() : session_(ssh_new()), connected_(false) {}
    ~SshSessionGuard() {
        if (session_) {
            if (connected_) {
                ssh_disconnect(session_);
            }
            ssh_free(session_);
        }
    }
    SshSessionGuard(const SshSessionGuard&) = delete;
    SshSessionGuard& operator=(const SshSessionGuard&) = delete;

    ssh_session get() const { return session_; }
    void markConnected() { connected_ = true; }

private:
    ssh_session session_;
    bool connected_;
};

class SshChannelGuard {
public:
    explicit SshChannelGuard(ssh_session session) : channel_(ssh_channel_new(session)), open_(false) {}
    ~SshChannelGuard() {
        if (channel_) {
            if (open_) {
                ssh_channel_send_eof(channel_);
                ssh_channel_close(channel_);
            }
            ssh_channel_free(channel_);
        }
    }
    SshChannelGuard(const SshChannelGuard&) = delete;
    SshChannelGuard& operator=(const SshChannelGuard&) = delete;

    ssh_channel get() const { return channel_; }
    void markOpen() { open_ = true; }

private:
    ssh_channel channel_;
    bool open_;
};

} // namespace

RemoteShellTransport::RemoteShellTransport(const ToolConfig& config)
    : username_(config.sshUsername)
    , password_(config.ipmiPassword)
    , port_(static_cast<unsigned int>(config.sshPort))
    , connectTimeoutSec_(config.connectTimeoutSec)
    , readTimeoutSec_(config.requestTimeoutSec)
    , lastErrorKind_(ErrorKind::None) {
}

void RemoteShellTransport::fail(ErrorKind kind, const std::string& message) {
    lastErrorKind_ = kind;
    lastError_ = message;
    Logger::error(message);
}

bool RemoteShellTransport::execute(const Target& target, const TransportPayload& payload,
                                   TransportResponse& response) {
    response = TransportResponse();
    const std::string& address = target.managementAddress;

    SshSessionGuard session;
    if (session.get() == nullptr) {
        fail(ErrorKind::ProtocolError, "failed to create SSH session for " + target.hostname);
        return false;
    }

    Logger::debug("Connecting to " + username_ + "@" + address + ":" + std::to_string(port_));

    // BMC host keys are regenerated on every firmware flash, so the known_hosts
    // check is not performed
    if (ssh_options_set(session.get(), SSH_OPTIONS_HOST, address.c_str()) != SSH_OK ||
        ssh_options_set(session.get(), SSH_OPTIONS_USER, username_.c_str()) != SSH_OK ||
        ssh_options_set(session.get(), SSH_OPTIONS_PORT, &port_) != SSH_OK ||
        ssh_options_set(session.get(), SSH_OPTIONS_TIMEOUT, &connectTimeoutSec_) != SSH_OK) {
        fail(ErrorKind::ProtocolError, "failed to configure SSH session for " + target.hostname +
             ": " + ssh_get_error(session.get()));
        return false;
    }

    if (ssh_connect(session.get()) != SSH_OK) {
        fail(ErrorKind::Unreachable, "failed to connect to " + target.hostname + " (" + address +
             "): " + ssh_get_error(session.get()));
        return false;
    }
    session.markConnected();

    int rc = ssh_userauth_password(session.get(), nullptr, password_.c_str());
    if (rc == SSH_AUTH_DENIED || rc == SSH_AUTH_PARTIAL) {
        fail(ErrorKind::AuthenticationFailed, "authentication as " + username_ + " rejected by " +
             target.hostname);
        return false;
    }
    if (rc != SSH_AUTH_SUCCESS) {
        fail(ErrorKind::ProtocolError, "authentication with " + target.hostname + " failed: " +
             ssh_get_error(session.get()));
        return false;
    }

    SshChannelGuard channel(session.get());
    if (channel.get() == nullptr) {
        fail(ErrorKind::ProtocolError, "failed to create SSH channel for " + target.hostname);
        return false;
    }
    if (ssh_channel_open_session(channel.get()) != SSH_OK) {
        fail(ErrorKind::ProtocolError, "failed to open SSH channel for " + target.hostname + ": " +
             ssh_get_error(session.get()));
        return false;
    }
    channel.markOpen();

    Logger::info("Running '" + payload.command + "' on " + target.hostname);
    if (ssh_channel_request_exec(channel.get(), payload.command.c_str()) != SSH_OK) {
        fail(ErrorKind::ProtocolError, "failed to execute command on " + target.hostname + ": " +
             ssh_get_error(session.get()));
        return false;
    }

    // libssh only bounds the connect; a stalled racadm is bounded here
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(readTimeoutSec_);
    char buffer[4096];
    for (;;) {
        int count = ssh_channel_read_timeout(channel.get(), buffer, sizeof(buffer), 0, 1000);
        if (count == SSH_ERROR) {
            fail(ErrorKind::ProtocolError, "failed reading output from " + target.hostname + ": " +
                 ssh_get_error(session.get()));
            return false;
        }
        if (count > 0) {
            response.output.append(buffer, static_cast<size_t>(count));
            continue;
        }
        if (ssh_channel_is_eof(channel.get())) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            fail(ErrorKind::TimedOut, "command on " + target.hostname + " did not finish within " +
                 std::to_string(readTimeoutSec_) + "s");
            return false;
        }
    }

    int count;
    while ((count = ssh_channel_read_timeout(channel.get(), buffer, sizeof(buffer), 1, 1000)) > 0) {
        response.output.append(buffer, static_cast<size_t>(count));
    }

    response.exitStatus = ssh_channel_get_exit_status(channel.get());
    Logger::debug("Remote command exited with status " + std::to_string(response.exitStatus));

    lastErrorKind_ = ErrorKind::None;
    lastError_.clear();
    return true;
}
