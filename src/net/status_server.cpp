#include "drover/net/status_server.hpp"

#include <iostream>

namespace drover {

StatusServer::StatusServer(int port) : port_(port) {
    // Connection logging would interleave with the operator console
    server_.clear_access_channels(websocketpp::log::alevel::all);
    server_.clear_error_channels(websocketpp::log::elevel::all);

    server_.init_asio();
    server_.set_reuse_addr(true);

    server_.set_open_handler([this](ConnectionHdl hdl) { onOpen(hdl); });
    server_.set_close_handler([this](ConnectionHdl hdl) { onClose(hdl); });
    server_.set_message_handler(
        [this](ConnectionHdl hdl, WebSocketServer::message_ptr msg) { onMessage(hdl, msg); });
}

StatusServer::~StatusServer() {
    stop();
}

bool StatusServer::start() {
    try {
        std::lock_guard<std::mutex> lock(mutex_);

        if (running_) {
            return true;
        }

        server_.listen(static_cast<uint16_t>(port_));
        server_.start_accept();

        serverThread_ = std::thread([this]() {
            try {
                server_.run();
            } catch (const std::exception& e) {
                std::cerr << "Status server error: " << e.what() << std::endl;
            }
        });

        running_ = true;
        juce::Logger::writeToLog("Status server started on port " + juce::String(port_));
        return true;

    } catch (const std::exception& e) {
        juce::Logger::writeToLog("ERROR: Failed to start status server on port " +
                                 juce::String(port_) + ": " + e.what());
        return false;
    }
}

void StatusServer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        connections_.clear();
    }

    try {
        server_.stop();

        // The close handler takes the lock, so join without holding it
        if (serverThread_.joinable()) {
            serverThread_.join();
        }

        juce::Logger::writeToLog("Status server stopped");

    } catch (const std::exception& e) {
        juce::Logger::writeToLog(juce::String("ERROR: Error stopping status server: ") + e.what());
    }
}

bool StatusServer::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void StatusServer::agentLoggedIn(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        agents_.insert(name);
    }
    broadcast(makeEvent("login", name));
}

void StatusServer::agentLoggedOut(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        agents_.erase(name);
    }
    broadcast(makeEvent("logout", name));
}

std::vector<std::string> StatusServer::getLoggedInAgents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(agents_.begin(), agents_.end());
}

size_t StatusServer::getClientCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

std::string StatusServer::makeEvent(const std::string& type, const std::string& agent) {
    juce::DynamicObject::Ptr event = new juce::DynamicObject();
    event->setProperty("type", juce::String(type));
    event->setProperty("agent", juce::String(agent));
    return juce::JSON::toString(juce::var(event.get()), true).toStdString();
}

std::string StatusServer::handleRequest(const std::string& payload) const {
    juce::var request;
    if (juce::JSON::parse(juce::String(payload), request).failed() || !request.isObject())
        return {};

    if (request["type"].toString() != "list")
        return {};

    juce::Array<juce::var> names;
    for (const auto& name : getLoggedInAgents())
        names.add(juce::String(name));

    juce::DynamicObject::Ptr reply = new juce::DynamicObject();
    reply->setProperty("type", "agents");
    reply->setProperty("agents", names);
    return juce::JSON::toString(juce::var(reply.get()), true).toStdString();
}

void StatusServer::onOpen(ConnectionHdl hdl) {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.insert(hdl);
}

void StatusServer::onClose(ConnectionHdl hdl) {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.erase(hdl);
}

void StatusServer::onMessage(ConnectionHdl hdl, WebSocketServer::message_ptr msg) {
    const auto reply = handleRequest(msg->get_payload());
    if (reply.empty())
        return;

    try {
        server_.send(hdl, reply, websocketpp::frame::opcode::text);
    } catch (const std::exception& e) {
        std::cerr << "Failed to send status reply: " << e.what() << std::endl;
    }
}

void StatusServer::broadcast(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& hdl : connections_) {
        try {
            server_.send(hdl, message, websocketpp::frame::opcode::text);
        } catch (const std::exception& e) {
            std::cerr << "Failed to send status event: " << e.what() << std::endl;
        }
    }
}

}  // namespace drover
