#include "text_slot.hpp"

bool TextSlot::try_fill(std::string text){
    {
        std::lock_guard lg(m_);
        if(present_) return false;
        text_ = std::move(text);
        present_ = true;
    }
    cv_.notify_all();
    return true;
}

bool TextSlot::filled() const {
    std::lock_guard lg(m_);
    return present_;
}

std::optional<std::string> TextSlot::value() const {
    std::lock_guard lg(m_);
    if(!present_) return std::nullopt;
    return text_;
}

std::optional<std::string> TextSlot::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock lk(m_);
    if(!cv_.wait_for(lk, timeout, [this]{ return present_; })) return std::nullopt;
    return text_;
}
