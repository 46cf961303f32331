#include "Context.hpp"
#include <vector>

namespace sqlbridge {

Context::Context(std::shared_ptr<Context> parent, std::optional<Clock::time_point> deadline)
    : m_parent(std::move(parent)), m_deadline(deadline) {}

Context::~Context() {
    if (m_parent && m_parentCallbackId != 0) {
        m_parent->removeCallback(m_parentCallbackId);
    }
}

std::shared_ptr<Context> Context::background() {
    return std::shared_ptr<Context>(new Context(nullptr, std::nullopt));
}

std::shared_ptr<Context> Context::withCancel(const std::shared_ptr<Context>& parent) {
    auto ctx = std::shared_ptr<Context>(new Context(parent, std::nullopt));
    if (parent) {
        std::weak_ptr<Context> weak = ctx;
        ctx->m_parentCallbackId = parent->onCancel([weak]() {
            if (auto self = weak.lock()) {
                self->cancel();
            }
        });
    }
    return ctx;
}

std::shared_ptr<Context> Context::withTimeout(const std::shared_ptr<Context>& parent,
                                              std::chrono::milliseconds timeout) {
    auto ctx = withCancel(parent);
    ctx->m_deadline = Clock::now() + timeout;
    return ctx;
}

void Context::cancel() {
    if (m_cancelled.exchange(true)) {
        return;
    }

    // Run callbacks outside the lock; they may cancel children
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& entry : m_callbacks) {
            callbacks.push_back(std::move(entry.second));
        }
        m_callbacks.clear();
    }
    for (auto& cb : callbacks) {
        cb();
    }
}

bool Context::isDone() const {
    if (m_cancelled.load()) {
        return true;
    }
    auto dl = deadline();
    if (dl && Clock::now() >= *dl) {
        return true;
    }
    return m_parent && m_parent->isDone();
}

std::string Context::reason() const {
    for (const Context* ctx = this; ctx; ctx = ctx->m_parent.get()) {
        if (ctx->m_cancelled.load()) {
            return "context cancelled";
        }
    }
    auto dl = deadline();
    if (dl && Clock::now() >= *dl) {
        return "context deadline exceeded";
    }
    return "";
}

std::optional<Context::Clock::time_point> Context::deadline() const {
    std::optional<Clock::time_point> result = m_deadline;
    if (m_parent) {
        auto parentDeadline = m_parent->deadline();
        if (parentDeadline && (!result || *parentDeadline < *result)) {
            result = parentDeadline;
        }
    }
    return result;
}

std::optional<std::chrono::milliseconds> Context::remaining() const {
    auto dl = deadline();
    if (!dl) {
        return std::nullopt;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*dl - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

size_t Context::onCancel(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_cancelled.load()) {
            size_t id = m_nextCallbackId++;
            m_callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void Context::removeCallback(size_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callbacks.erase(id);
}

CancelRegistration::CancelRegistration(ContextPtr context, Context::Callback callback)
    : m_context(std::move(context)) {
    if (m_context) {
        m_id = m_context->onCancel(std::move(callback));
    }
}

CancelRegistration::~CancelRegistration() {
    if (m_context && m_id != 0) {
        m_context->removeCallback(m_id);
    }
}

}  // namespace sqlbridge
