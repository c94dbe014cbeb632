#include "../include/message_publisher.h"
#include <iostream>
#include <algorithm>
#include <cctype>

namespace GazeGuard
{
    MessagePublisher::~MessagePublisher()
    {
        shutdown();
    }

    bool MessagePublisher::initialize(const std::string &endpoint)
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);
        closeSocket();

        try
        {
            endpoint_ = endpoint;
            context_ = std::make_unique<zmq::context_t>(1);
            publisher_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
            publisher_->set(zmq::sockopt::linger, LINGER_MS);
            publisher_->set(zmq::sockopt::sndhwm, SEND_HIGH_WATER_MARK);
            publisher_->bind(endpoint_);

            is_initialized_ = true;
            messages_sent_ = 0;
            failed_sends_ = 0;
            std::cout << "MessagePublisher: Bound to " << endpoint_ << std::endl;
            return true;
        }
        catch (const zmq::error_t &e)
        {
            std::cerr << "MessagePublisher: ZeroMQ error during initialization: " << e.what() << std::endl;
            publisher_.reset();
            context_.reset();
            is_initialized_ = false;
            return false;
        }
    }

    bool MessagePublisher::publish(const std::string &topic, const std::string &payload)
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);

        if (!is_initialized_ || !publisher_)
        {
            failed_sends_++;
            return false;
        }

        try
        {
            auto topic_sent = publisher_->send(zmq::buffer(topic), zmq::send_flags::sndmore | zmq::send_flags::dontwait);
            if (!topic_sent)
            {
                failed_sends_++;
                std::cerr << "MessagePublisher: Send queue full, dropping " << topic << std::endl;
                return false;
            }
            // Once the first frame is queued the rest of the message is delivered atomically
            auto payload_sent = publisher_->send(zmq::buffer(payload), zmq::send_flags::none);
            if (!payload_sent)
            {
                failed_sends_++;
                return false;
            }
            messages_sent_++;
            return true;
        }
        catch (const zmq::error_t &e)
        {
            failed_sends_++;
            std::cerr << "MessagePublisher: ZeroMQ error during send: " << e.what() << std::endl;
            return false;
        }
    }

    bool MessagePublisher::isReady() const
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);
        return is_initialized_ && publisher_ != nullptr;
    }

    void MessagePublisher::getStats(size_t &sent, size_t &failed) const
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);
        sent = messages_sent_;
        failed = failed_sends_;
    }

    void MessagePublisher::shutdown()
    {
        std::lock_guard<std::mutex> lock(publisher_mutex_);
        if (!is_initialized_)
            return;

        closeSocket();
        std::cout << "MessagePublisher: Shutdown complete. Sent: "
                  << messages_sent_ << ", Failed: " << failed_sends_ << std::endl;
    }

    void MessagePublisher::closeSocket()
    {
        try
        {
            if (publisher_)
            {
                publisher_->close();
                publisher_.reset();
            }
            if (context_)
            {
                context_->close();
                context_.reset();
            }
        }
        catch (const zmq::error_t &e)
        {
            std::cerr << "MessagePublisher: Error during shutdown: " << e.what() << std::endl;
        }
        is_initialized_ = false;
    }

    std::string MessagePublisher::topicFor(const std::string &alarm_name)
    {
        std::string topic = alarm_name;
        std::transform(topic.begin(), topic.end(), topic.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return "alarm." + topic;
    }
}
