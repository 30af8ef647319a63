/**
 * @file Reactor.cpp
 * @brief Single-threaded epoll event loop
 */

#include "wharf/Reactor.h"
#include "wharf/Debug.h"

#include <array>
#include <cerrno>
#include <exception>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace Wharf {

namespace {

constexpr int MAX_EVENTS_PER_WAIT = 64;

// Generation 0 is reserved for the wakeup eventfd.
constexpr uint32_t WAKEUP_GENERATION = 0;

uint32_t toEpoll(uint32_t interest) {
    uint32_t events = 0;
    if (interest & IoEvent::READABLE) events |= EPOLLIN | EPOLLRDHUP;
    if (interest & IoEvent::WRITABLE) events |= EPOLLOUT;
    return events;
}

uint32_t fromEpoll(uint32_t events) {
    uint32_t out = 0;
    if (events & (EPOLLIN | EPOLLRDHUP | EPOLLPRI)) out |= IoEvent::READABLE;
    if (events & EPOLLOUT) out |= IoEvent::WRITABLE;
    if (events & EPOLLHUP) out |= IoEvent::HANGUP;
    if (events & EPOLLERR) out |= IoEvent::ERROR;
    return out;
}

uint64_t packToken(int fd, uint32_t generation) {
    return (static_cast<uint64_t>(generation) << 32) | static_cast<uint32_t>(fd);
}

}  // namespace

bool Reactor::initialize(std::string& errorMsg) {
    m_epollFd.reset(::epoll_create1(EPOLL_CLOEXEC));
    if (!m_epollFd.isValid()) {
        errorMsg = "epoll_create1() failed: " + errnoToString(errno);
        return false;
    }

    m_wakeFd.reset(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC));
    if (!m_wakeFd.isValid()) {
        errorMsg = "eventfd() failed: " + errnoToString(errno);
        return false;
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.u64 = packToken(m_wakeFd.get(), WAKEUP_GENERATION);
    if (::epoll_ctl(m_epollFd.get(), EPOLL_CTL_ADD, m_wakeFd.get(), &ev) < 0) {
        errorMsg = "epoll_ctl(wakeup) failed: " + errnoToString(errno);
        return false;
    }

    m_stopRequested.store(false);
    return true;
}

bool Reactor::registerHandle(int fd, uint32_t interest, EventHandler* handler, std::string& errorMsg) {
    if (!m_epollFd.isValid()) {
        errorMsg = "Reactor not initialized";
        return false;
    }
    if (fd < 0 || handler == nullptr) {
        errorMsg = "Invalid registration";
        return false;
    }
    if (m_handles.count(fd) != 0) {
        errorMsg = "fd " + std::to_string(fd) + " is already registered";
        return false;
    }

    Registration reg;
    reg.handler = handler;
    reg.interest = interest;
    reg.generation = m_nextGeneration++;
    if (m_nextGeneration == WAKEUP_GENERATION) {
        m_nextGeneration = 1;
    }

    epoll_event ev{};
    ev.events = toEpoll(interest);
    ev.data.u64 = packToken(fd, reg.generation);
    if (::epoll_ctl(m_epollFd.get(), EPOLL_CTL_ADD, fd, &ev) < 0) {
        errorMsg = "epoll_ctl(ADD) failed: " + errnoToString(errno);
        return false;
    }

    m_handles[fd] = reg;
    return true;
}

bool Reactor::modifyInterest(int fd, uint32_t interest, std::string& errorMsg) {
    auto it = m_handles.find(fd);
    if (it == m_handles.end()) {
        errorMsg = "fd " + std::to_string(fd) + " is not registered";
        return false;
    }
    if (it->second.interest == interest) {
        return true;
    }

    epoll_event ev{};
    ev.events = toEpoll(interest);
    ev.data.u64 = packToken(fd, it->second.generation);
    if (::epoll_ctl(m_epollFd.get(), EPOLL_CTL_MOD, fd, &ev) < 0) {
        errorMsg = "epoll_ctl(MOD) failed: " + errnoToString(errno);
        return false;
    }

    it->second.interest = interest;
    return true;
}

void Reactor::deregister(int fd) {
    auto it = m_handles.find(fd);
    if (it == m_handles.end()) {
        return;
    }
    m_handles.erase(it);

    if (m_epollFd.isValid()) {
        // ENOENT/EBADF here means the fd was already closed; nothing left to undo.
        (void)::epoll_ctl(m_epollFd.get(), EPOLL_CTL_DEL, fd, nullptr);
    }
}

bool Reactor::isRegistered(int fd) const {
    return m_handles.count(fd) != 0;
}

uint32_t Reactor::interestOf(int fd) const {
    auto it = m_handles.find(fd);
    return it == m_handles.end() ? IoEvent::NONE : it->second.interest;
}

bool Reactor::run(std::string& errorMsg) {
    if (!m_epollFd.isValid()) {
        errorMsg = "Reactor not initialized";
        return false;
    }

    m_running.store(true);
    bool ok = true;
    while (!m_stopRequested.load()) {
        if (!runOnce(HOUSEKEEPING_INTERVAL_MS, errorMsg)) {
            LOG_ERROR("[Reactor] Fatal: " << errorMsg);
            ok = false;
            break;
        }
    }
    m_running.store(false);
    m_stopRequested.store(false);
    return ok;
}

bool Reactor::runOnce(int timeoutMs, std::string& errorMsg) {
    std::array<epoll_event, MAX_EVENTS_PER_WAIT> events{};
    const int count = waitForEvents(events.data(), MAX_EVENTS_PER_WAIT, timeoutMs);

    if (count < 0) {
        if (errno != EINTR) {
            errorMsg = "epoll_wait() failed: " + errnoToString(errno);
            return false;
        }
    }

    for (int i = 0; i < count; ++i) {
        const uint64_t token = events[i].data.u64;
        const int fd = static_cast<int>(token & 0xFFFFFFFFu);
        const uint32_t generation = static_cast<uint32_t>(token >> 32);

        if (generation == WAKEUP_GENERATION) {
            drainWakeup();
            continue;
        }
        dispatch(fd, generation, fromEpoll(events[i].events));
    }

    if (m_housekeeping) {
        try {
            m_housekeeping();
        } catch (const std::exception& e) {
            LOG_ERROR("[Reactor] Housekeeping threw: " << e.what());
        }
    }
    return true;
}

void Reactor::stop() {
    m_stopRequested.store(true);
    if (m_wakeFd.isValid()) {
        const uint64_t one = 1;
        // A full counter (EAGAIN) already guarantees a wakeup.
        ssize_t written = ::write(m_wakeFd.get(), &one, sizeof(one));
        (void)written;
    }
}

int Reactor::waitForEvents(epoll_event* events, int maxEvents, int timeoutMs) {
    return ::epoll_wait(m_epollFd.get(), events, maxEvents, timeoutMs);
}

void Reactor::dispatch(int fd, uint32_t generation, uint32_t events) {
    auto it = m_handles.find(fd);
    if (it == m_handles.end() || it->second.generation != generation) {
        return;  // Deregistered earlier in this batch
    }

    EventHandler* handler = it->second.handler;
    try {
        handler->handleEvent(fd, events);
    } catch (const std::exception& e) {
        LOG_ERROR("[Reactor] Handler for fd " << fd << " threw: " << e.what());
        try {
            handler->handleError(fd, e.what());
        } catch (const std::exception& inner) {
            LOG_ERROR("[Reactor] handleError for fd " << fd << " threw: " << inner.what());
            deregister(fd);
        }
    }
}

void Reactor::drainWakeup() {
    uint64_t value = 0;
    while (::read(m_wakeFd.get(), &value, sizeof(value)) > 0) {
    }
}

}  // namespace Wharf
