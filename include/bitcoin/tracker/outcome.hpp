/**
 * Copyright (c) 2011-2025 libbitcoin developers (see AUTHORS)
 *
 * This file is part of libbitcoin.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#ifndef LIBBITCOIN_TRACKER_OUTCOME_HPP
#define LIBBITCOIN_TRACKER_OUTCOME_HPP

#include <ostream>
#include <boost/json.hpp>
#include <bitcoin/tracker/define.hpp>

namespace libbitcoin {
namespace tracker {

/// Result of a transaction within a specific block.
/// Computed once per (block, transaction) and immutable thereafter.
struct BCT_API outcome
{
    enum class kind : uint8_t
    {
        invalid,
        valid
    };

    static outcome invalid(const block_id& block_hash) NOEXCEPT;
    static outcome valid(const block_id& block_hash, bool successful) NOEXCEPT;

    bool is_valid() const NOEXCEPT;

    /// Successful is meaningful only when valid.
    bool is_successful() const NOEXCEPT;

    /// {"type":"invalid","blockHash":...} or
    /// {"type":"valid","blockHash":...,"successful":...}
    std::string to_string() const NOEXCEPT;

    bool operator==(const outcome& other) const NOEXCEPT;
    bool operator!=(const outcome& other) const NOEXCEPT;

    kind type{ kind::invalid };
    block_id block_hash{};
    bool successful{};
};

BCT_API std::ostream& operator<<(std::ostream& stream,
    const outcome& value) NOEXCEPT;

BCT_API void tag_invoke(const boost::json::value_from_tag&,
    boost::json::value& value, const outcome& instance) NOEXCEPT;
BCT_API outcome tag_invoke(const boost::json::value_to_tag<outcome>&,
    const boost::json::value& value) THROWS;

} // namespace tracker
} // namespace libbitcoin

#endif
