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
#include <bitcoin/tracker/outcome.hpp>

#include <ostream>
#include <stdexcept>
#include <boost/json.hpp>
#include <bitcoin/tracker/define.hpp>

namespace libbitcoin {
namespace tracker {

using namespace boost::json;

BC_PUSH_WARNING(NO_THROW_IN_NOEXCEPT)

// Not localizable.
constexpr auto type_name = "type";
constexpr auto block_name = "blockHash";
constexpr auto successful_name = "successful";
constexpr auto valid_name = "valid";
constexpr auto invalid_name = "invalid";

outcome outcome::invalid(const block_id& block_hash) NOEXCEPT
{
    return { kind::invalid, block_hash, false };
}

outcome outcome::valid(const block_id& block_hash, bool successful) NOEXCEPT
{
    return { kind::valid, block_hash, successful };
}

bool outcome::is_valid() const NOEXCEPT
{
    return type == kind::valid;
}

bool outcome::is_successful() const NOEXCEPT
{
    return is_valid() && successful;
}

std::string outcome::to_string() const NOEXCEPT
{
    return serialize(value_from(*this));
}

// Success is not compared for invalid outcomes.
bool outcome::operator==(const outcome& other) const NOEXCEPT
{
    return type == other.type
        && block_hash == other.block_hash
        && is_successful() == other.is_successful();
}

bool outcome::operator!=(const outcome& other) const NOEXCEPT
{
    return !(*this == other);
}

std::ostream& operator<<(std::ostream& stream, const outcome& value) NOEXCEPT
{
    stream << value.to_string();
    return stream;
}

// JSON.
// ----------------------------------------------------------------------------

void tag_invoke(const value_from_tag&, value& out,
    const outcome& instance) NOEXCEPT
{
    if (instance.is_valid())
    {
        out =
        {
            { type_name, valid_name },
            { block_name, instance.block_hash },
            { successful_name, instance.successful }
        };
    }
    else
    {
        out =
        {
            { type_name, invalid_name },
            { block_name, instance.block_hash }
        };
    }
}

outcome tag_invoke(const value_to_tag<outcome>&, const value& in) THROWS
{
    const auto& object = in.as_object();
    const auto type = std::string{ object.at(type_name).as_string() };
    const auto block = std::string{ object.at(block_name).as_string() };

    if (type == valid_name)
        return outcome::valid(block, object.at(successful_name).as_bool());

    if (type == invalid_name)
        return outcome::invalid(block);

    throw std::invalid_argument{ "outcome type" };
}

BC_POP_WARNING()

} // namespace tracker
} // namespace libbitcoin
