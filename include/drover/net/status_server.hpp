#pragma once

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include <juce_core/juce_core.h>

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace drover {

/**
 * @brief WebSocket server publishing agent login/logout events
 *
 * Clients receive {"type":"login","agent":...} and {"type":"logout","agent":...}
 * as agents come and go, and can ask for the current set with
 * {"type":"list"}, answered by {"type":"agents","agents":[...]}.
 */
class StatusServer {
  public:
    using WebSocketServer = websocketpp::server<websocketpp::config::asio>;
    using ConnectionHdl = websocketpp::connection_hdl;

    /**
     * @brief Construct the status server
     * @param port Port to listen on
     */
    explicit StatusServer(int port = 8080);

    ~StatusServer();

    StatusServer(const StatusServer&) = delete;
    StatusServer& operator=(const StatusServer&) = delete;

    /**
     * @brief Start listening on a background thread
     * @return true if started successfully
     */
    bool start();

    void stop();

    bool isRunning() const;

    int getPort() const {
        return port_;
    }

    /**
     * @brief Record an agent as logged in and notify clients
     */
    void agentLoggedIn(const std::string& name);

    /**
     * @brief Record an agent as logged out and notify clients
     */
    void agentLoggedOut(const std::string& name);

    /**
     * @brief Names of agents currently logged in, sorted
     */
    std::vector<std::string> getLoggedInAgents() const;

    size_t getClientCount() const;

    /**
     * @brief Answer a client request
     *
     * Exposed separately from the socket handler so the protocol can be
     * exercised without a connection.
     * @return The reply to send, or an empty string if there is none
     */
    std::string handleRequest(const std::string& payload) const;

    static std::string makeEvent(const std::string& type, const std::string& agent);

  private:
    void onOpen(ConnectionHdl hdl);
    void onClose(ConnectionHdl hdl);
    void onMessage(ConnectionHdl hdl, WebSocketServer::message_ptr msg);

    void broadcast(const std::string& message);

    WebSocketServer server_;
    std::thread serverThread_;

    int port_;
    bool running_ = false;

    std::set<ConnectionHdl, std::owner_less<ConnectionHdl>> connections_;
    std::set<std::string> agents_;

    mutable std::mutex mutex_;
};

}  // namespace drover
