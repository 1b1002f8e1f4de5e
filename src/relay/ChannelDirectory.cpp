#include "relay/ChannelDirectory.h"

#include <algorithm>
#include <utility>

namespace walkierelay::relay {

const Membership* Channel::find_member(const ConnectionId& id) const {
    auto it = std::find_if(members.begin(), members.end(),
                           [&](const Membership& m) { return m.connection_id == id; });
    return it == members.end() ? nullptr : &*it;
}

const Membership* Channel::find_member_by_user_id(const std::string& user_id) const {
    auto it = std::find_if(members.begin(), members.end(),
                           [&](const Membership& m) { return m.user_id == user_id; });
    return it == members.end() ? nullptr : &*it;
}

Channel& ChannelDirectory::get_or_create(const std::string& channel_id, std::int64_t now_ms) {
    auto [it, inserted] = channels_.try_emplace(channel_id);
    if (inserted) {
        it->second.channel_id = channel_id;
        it->second.created_at_ms = now_ms;
    }
    return it->second;
}

Channel* ChannelDirectory::find(const std::string& channel_id) {
    auto it = channels_.find(channel_id);
    return it == channels_.end() ? nullptr : &it->second;
}

const Channel* ChannelDirectory::find(const std::string& channel_id) const {
    auto it = channels_.find(channel_id);
    return it == channels_.end() ? nullptr : &it->second;
}

bool ChannelDirectory::add_member(const std::string& channel_id, const ConnectionId& id,
                                  const std::string& user_id, std::int64_t now_ms) {
    Channel& channel = get_or_create(channel_id, now_ms);
    if (channel.find_member(id)) return false;
    channel.members.push_back(Membership{id, user_id, now_ms});
    return true;
}

std::optional<std::string> ChannelDirectory::rename_member(const std::string& channel_id,
                                                          const ConnectionId& id,
                                                          const std::string& user_id) {
    Channel* channel = find(channel_id);
    if (!channel) return std::nullopt;

    auto it = std::find_if(channel->members.begin(), channel->members.end(),
                           [&](const Membership& m) { return m.connection_id == id; });
    if (it == channel->members.end() || it->user_id == user_id) return std::nullopt;

    std::string previous = std::exchange(it->user_id, user_id);
    return previous;
}

std::optional<Membership> ChannelDirectory::remove_member(const std::string& channel_id,
                                                          const ConnectionId& id,
                                                          std::size_t* remaining) {
    auto cit = channels_.find(channel_id);
    if (cit == channels_.end()) return std::nullopt;

    auto& members = cit->second.members;
    auto mit = std::find_if(members.begin(), members.end(),
                            [&](const Membership& m) { return m.connection_id == id; });
    if (mit == members.end()) return std::nullopt;

    Membership removed = std::move(*mit);
    members.erase(mit);

    const std::size_t left = members.size();
    if (left == 0) channels_.erase(cit);
    if (remaining) *remaining = left;
    return removed;
}

std::vector<std::string> ChannelDirectory::list_members(const std::string& channel_id,
                                                        const std::optional<ConnectionId>& excluding) const {
    std::vector<std::string> users;
    const Channel* channel = find(channel_id);
    if (!channel) return users;

    users.reserve(channel->members.size());
    for (const auto& m : channel->members) {
        if (excluding && m.connection_id == *excluding) continue;
        users.push_back(m.user_id);
    }
    return users;
}

std::optional<Membership> ChannelDirectory::find_member_by_user_id(const std::string& channel_id,
                                                                   const std::string& user_id) const {
    const Channel* channel = find(channel_id);
    if (!channel) return std::nullopt;
    const Membership* m = channel->find_member_by_user_id(user_id);
    if (!m) return std::nullopt;
    return *m;
}

void ChannelDirectory::increment_message_count(const std::string& channel_id) {
    if (Channel* channel = find(channel_id)) ++channel->message_count;
}

std::size_t ChannelDirectory::sweep_empty() {
    std::size_t cleaned = 0;
    for (auto it = channels_.begin(); it != channels_.end();) {
        if (it->second.members.empty()) {
            it = channels_.erase(it);
            ++cleaned;
        } else {
            ++it;
        }
    }
    return cleaned;
}

std::uint64_t ChannelDirectory::total_message_count() const {
    std::uint64_t total = 0;
    for (const auto& [id, channel] : channels_) total += channel.message_count;
    return total;
}

std::vector<ChannelSnapshot> ChannelDirectory::snapshot() const {
    std::vector<ChannelSnapshot> out;
    out.reserve(channels_.size());
    for (const auto& [id, channel] : channels_) {
        out.push_back(ChannelSnapshot{id, channel.members, channel.created_at_ms, channel.message_count});
    }
    return out;
}

} // namespace walkierelay::relay
