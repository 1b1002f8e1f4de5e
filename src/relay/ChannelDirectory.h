#pragma once

#include "relay/Connection.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace walkierelay::relay {

struct Membership {
    ConnectionId connection_id;
    std::string user_id;
    std::int64_t joined_at_ms = 0;
};

struct Channel {
    std::string channel_id;
    std::vector<Membership> members;  // insertion order, unique connection ids
    std::int64_t created_at_ms = 0;
    std::uint64_t message_count = 0;

    const Membership* find_member(const ConnectionId& id) const;
    const Membership* find_member_by_user_id(const std::string& user_id) const;
};

struct ChannelSnapshot {
    std::string channel_id;
    std::vector<Membership> members;
    std::int64_t created_at_ms = 0;
    std::uint64_t message_count = 0;
};

// Owns every Channel record. A channel is deleted in the same call that
// removes its last member; sweep_empty() only catches channels left empty
// by some other path.
class ChannelDirectory {
public:
    ChannelDirectory() = default;

    ChannelDirectory(const ChannelDirectory&) = delete;
    ChannelDirectory& operator=(const ChannelDirectory&) = delete;

    Channel& get_or_create(const std::string& channel_id, std::int64_t now_ms);

    Channel* find(const std::string& channel_id);
    const Channel* find(const std::string& channel_id) const;

    // Returns true when the member was newly added.
    bool add_member(const std::string& channel_id, const ConnectionId& id,
                    const std::string& user_id, std::int64_t now_ms);

    // Re-labels an existing membership. Returns the previous user id when it
    // changed, nothing for a non-member or an unchanged name.
    std::optional<std::string> rename_member(const std::string& channel_id, const ConnectionId& id,
                                             const std::string& user_id);

    // The removed membership, or nothing for an unknown channel / non-member.
    // `remaining` receives the member count left behind.
    std::optional<Membership> remove_member(const std::string& channel_id, const ConnectionId& id,
                                            std::size_t* remaining = nullptr);

    std::vector<std::string> list_members(const std::string& channel_id,
                                          const std::optional<ConnectionId>& excluding = std::nullopt) const;

    std::optional<Membership> find_member_by_user_id(const std::string& channel_id,
                                                     const std::string& user_id) const;

    void increment_message_count(const std::string& channel_id);

    std::size_t sweep_empty();

    std::size_t size() const noexcept { return channels_.size(); }
    std::uint64_t total_message_count() const;
    std::vector<ChannelSnapshot> snapshot() const;

private:
    std::map<std::string, Channel> channels_;
};

} // namespace walkierelay::relay
