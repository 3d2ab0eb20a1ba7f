#pragma once

#include "journal.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace sjournal_test
{

using namespace sjournal;

// Shared state of a capturing_writer; the writer itself is owned by the dispatcher
struct capture_state
{
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> datagrams;

    bool gated{false};
    bool gate_open{true};
    bool fail_writes{false};
    size_t writes_started{0};

    void close_gate()
    {
        std::lock_guard<std::mutex> lock(mutex);
        gated     = true;
        gate_open = false;
    }

    void open_gate()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            gate_open = true;
        }
        cv.notify_all();
    }

    // Wait until at least @p count writes have begun
    bool wait_for_writes_started(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5))
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&] { return writes_started >= count; });
    }

    // Wait until at least @p count datagrams have been captured
    bool wait_for(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5))
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&] { return datagrams.size() >= count; });
    }

    std::vector<std::string> snapshot()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return datagrams;
    }
};

// Writer that stores every datagram, optionally blocking on a gate first
class capturing_writer final : public datagram_writer
{
  public:
    explicit capturing_writer(std::shared_ptr<capture_state> state) : state_(std::move(state)) {}

    bool write(const char *data, size_t len) override
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->writes_started++;
        state_->cv.notify_all();

        if (state_->gated) { state_->cv.wait(lock, [&] { return state_->gate_open; }); }
        if (state_->fail_writes) return false;

        state_->datagrams.emplace_back(data, len);
        state_->cv.notify_all();
        return true;
    }

  private:
    std::shared_ptr<capture_state> state_;
};

// Walker that returns a fixed stack and counts calls
class scripted_walker final : public stack_walker
{
  public:
    void set_stack(std::vector<std::uintptr_t> pcs)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stack_ = std::move(pcs);
    }

    void set_frame(std::uintptr_t pc, call_frame frame)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_[pc] = std::move(frame);
    }

    size_t collect(size_t, std::uintptr_t *out, size_t max_frames) override
    {
        collect_calls++;
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (; n < stack_.size() && n < max_frames; ++n) { out[n] = stack_[n]; }
        return n;
    }

    call_frame symbolize(std::uintptr_t pc) override
    {
        symbolize_calls++;
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = frames_.find(pc);
        return it != frames_.end() ? it->second : call_frame{};
    }

    std::atomic<size_t> collect_calls{0};
    std::atomic<size_t> symbolize_calls{0};

  private:
    std::mutex mutex_;
    std::vector<std::uintptr_t> stack_;
    std::map<std::uintptr_t, call_frame> frames_;
};

// Walker with one library frame on top of one application frame
inline std::shared_ptr<scripted_walker> make_app_walker()
{
    auto walker = std::make_shared<scripted_walker>();
    walker->set_frame(0x1000, {"/src/journal_client.hpp", 120, "void sjournal::journal_client::info<int>(char const*, int const&)"});
    walker->set_frame(0x2000, {"/src/app/main.cpp", 42, "app::run()"});
    walker->set_frame(0x3000, {"/src/app/main.cpp", 7, "main"});
    walker->set_stack({0x1000, 0x2000, 0x3000});
    return walker;
}

inline std::vector<journal_field> decode_or_empty(const std::string &datagram)
{
    auto fields = decode_record(datagram);
    return fields ? *fields : std::vector<journal_field>{};
}

// AF_UNIX datagram socket bound in a fresh temporary directory
class unix_test_server
{
  public:
    unix_test_server()
    {
        char dir_template[] = "/tmp/sjournal-test-XXXXXX";
        char *dir           = mkdtemp(dir_template);
        if (dir) { dir_ = dir; }
        path_ = dir_ + "/socket";

        fd_ = ::socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);

        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, path_.c_str(), sizeof(addr.sun_path) - 1);
        bound_ = fd_ >= 0 && ::bind(fd_, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) == 0;

        timeval tv{};
        tv.tv_sec = 5;
        if (fd_ >= 0) { ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)); }
    }

    ~unix_test_server()
    {
        if (fd_ >= 0) ::close(fd_);
        ::unlink(path_.c_str());
        if (!dir_.empty()) ::rmdir(dir_.c_str());
    }

    bool ok() const { return bound_; }
    const std::string &path() const { return path_; }

    // Receive one record; a record passed as a memfd is read back from the descriptor
    bool receive(std::string &record, bool *via_fd = nullptr)
    {
        std::vector<char> buf(16 * 1024 * 1024);

        union
        {
            cmsghdr align;
            char control[CMSG_SPACE(sizeof(int))];
        } control{};

        iovec iov{buf.data(), buf.size()};
        msghdr msg{};
        msg.msg_iov        = &iov;
        msg.msg_iovlen     = 1;
        msg.msg_control    = control.control;
        msg.msg_controllen = sizeof(control.control);

        ssize_t n = ::recvmsg(fd_, &msg, MSG_CMSG_CLOEXEC);
        if (n < 0) return false;

        for (cmsghdr *c = CMSG_FIRSTHDR(&msg); c; c = CMSG_NXTHDR(&msg, c))
        {
            if (c->cmsg_level == SOL_SOCKET && c->cmsg_type == SCM_RIGHTS)
            {
                int mfd;
                std::memcpy(&mfd, CMSG_DATA(c), sizeof(int));
                bool read_ok = read_descriptor(mfd, record);
                ::close(mfd);
                if (via_fd) *via_fd = true;
                return read_ok;
            }
        }

        record.assign(buf.data(), static_cast<size_t>(n));
        if (via_fd) *via_fd = false;
        return true;
    }

  private:
    static bool read_descriptor(int fd, std::string &out)
    {
        struct stat st{};
        if (::fstat(fd, &st) < 0) return false;

        out.resize(static_cast<size_t>(st.st_size));
        size_t total = 0;
        while (total < out.size())
        {
            ssize_t r = ::pread(fd, out.data() + total, out.size() - total, static_cast<off_t>(total));
            if (r <= 0) return false;
            total += static_cast<size_t>(r);
        }
        return true;
    }

    std::string dir_;
    std::string path_;
    int fd_{-1};
    bool bound_{false};
};

} // namespace sjournal_test
