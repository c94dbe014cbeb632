#ifndef GAZE_GUARD_MESSAGE_PUBLISHER_H
#define GAZE_GUARD_MESSAGE_PUBLISHER_H

#include <zmq.hpp>
#include <string>
#include <memory>
#include <mutex>

namespace GazeGuard
{
    /**
     * @brief Publishes alarm events on a ZeroMQ PUB socket.
     *
     * Every message is two frames: a topic ("alarm.drowsiness", "alarm.out_of_frame")
     * followed by the JSON payload, so subscribers can filter by prefix.
     */
    class MessagePublisher
    {
    private:
        std::unique_ptr<zmq::context_t> context_;
        std::unique_ptr<zmq::socket_t> publisher_;
        std::string endpoint_;
        bool is_initialized_ = false;
        mutable std::mutex publisher_mutex_;

        size_t messages_sent_ = 0;
        size_t failed_sends_ = 0;

        void closeSocket();

    public:
        static constexpr int LINGER_MS = 1000;
        static constexpr int SEND_HIGH_WATER_MARK = 1000;

        MessagePublisher() = default;
        ~MessagePublisher();

        /**
         * @brief Bind the publisher socket.
         * @param endpoint ZeroMQ endpoint such as "tcp://*:5556"
         * @return false when the bind fails
         */
        bool initialize(const std::string &endpoint);

        // Non-blocking; a full send queue counts as a failed send.
        bool publish(const std::string &topic, const std::string &payload);

        bool isReady() const;
        void getStats(size_t &sent, size_t &failed) const;
        const std::string &getEndpoint() const { return endpoint_; }

        void shutdown();

        static std::string topicFor(const std::string &alarm_name);

        MessagePublisher(const MessagePublisher &) = delete;
        MessagePublisher &operator=(const MessagePublisher &) = delete;
    };
}

#endif // GAZE_GUARD_MESSAGE_PUBLISHER_H
