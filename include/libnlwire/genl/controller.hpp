/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBNLWIRE_GENL_CONTROLLER_HPP_INCLUDED
#define LIBNLWIRE_GENL_CONTROLLER_HPP_INCLUDED

#include "libnlwire/errors.hpp"
#include "libnlwire/session/errors.hpp"
#include "libnlwire/session/session.hpp"
#include "libnlwire/session/types.hpp"
#include "libnlwire/types.hpp"
#include "libnlwire/wire/attribute.hpp"
#include "libnlwire/wire/attribute_codec.hpp"
#include "libnlwire/wire/byte_cursor.hpp"
#include "libnlwire/wire/defines.hpp"
#include "libnlwire/wire/header_codec.hpp"
#include "libnlwire/wire/message.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>

namespace libnlwire
{
namespace genl
{

/// @brief Defines well-known constants of the generic netlink controller family ("nlctrl").
///
struct Ctrl final
{
    /// The controller has fixed (by convention) family id - the first non-reserved message type.
    static constexpr wire::MessageType FamilyId = wire::ControlType::MinType;

    /// Version of the controller protocol.
    static constexpr std::uint8_t Version = 2;

    /// Max length of a family name (`GENL_NAMSIZ` without the terminating NUL).
    /// The kernel rejects longer names with `-EINVAL` (instead of `-ENOENT`).
    static constexpr std::size_t MaxFamilyNameLength = 15;

    struct Cmd final
    {
        static constexpr std::uint8_t Unspec      = 0;
        static constexpr std::uint8_t NewFamily   = 1;
        static constexpr std::uint8_t DelFamily   = 2;
        static constexpr std::uint8_t GetFamily   = 3;
        static constexpr std::uint8_t NewOps      = 4;
        static constexpr std::uint8_t DelOps      = 5;
        static constexpr std::uint8_t GetOps      = 6;
        static constexpr std::uint8_t NewMcastGrp = 7;
        static constexpr std::uint8_t DelMcastGrp = 8;
        static constexpr std::uint8_t GetMcastGrp = 9;
        static constexpr std::uint8_t GetPolicy   = 10;
    };

    struct Attr final
    {
        static constexpr wire::AttributeType Unspec      = 0;
        static constexpr wire::AttributeType FamilyId    = 1;
        static constexpr wire::AttributeType FamilyName  = 2;
        static constexpr wire::AttributeType Version     = 3;
        static constexpr wire::AttributeType HdrSize     = 4;
        static constexpr wire::AttributeType MaxAttr     = 5;
        static constexpr wire::AttributeType Ops         = 6;
        static constexpr wire::AttributeType McastGroups = 7;
    };

    struct OpAttr final
    {
        static constexpr wire::AttributeType Id    = 1;
        static constexpr wire::AttributeType Flags = 2;
    };

    struct McastGrpAttr final
    {
        static constexpr wire::AttributeType Name = 1;
        static constexpr wire::AttributeType Id   = 2;
    };

};  // Ctrl

/// @brief Defines an error of a controller reply which lacks a mandatory attribute.
///
struct UnexpectedReplyError final
{
    /// Type of the missing (or invalid) attribute.
    wire::AttributeType attribute;
};

/// @brief Defines an error of a multicast group which is not provided by a family.
///
struct MulticastGroupNotFoundError final
{};

/// @brief Defines description of a family operation (command).
///
struct Operation final
{
    std::uint32_t id;
    std::uint32_t flags;
};

/// @brief Defines description of a family multicast group.
///
struct MulticastGroup final
{
    PmrString     name;
    std::uint32_t id;
};

/// @brief Defines description of a generic netlink family, as reported by the controller.
///
struct FamilyInfo final
{
    std::uint16_t             id;
    PmrString                 name;
    std::uint32_t             version;
    std::uint32_t             header_size;
    std::uint32_t             max_attribute;
    PmrVector<Operation>      operations;
    PmrVector<MulticastGroup> multicast_groups;
};

/// @brief Defines the client of the generic netlink controller family.
///
/// Resolution of a family name to its numeric id is the bootstrap exchange of any generic netlink
/// application - the id is assigned by the kernel dynamically, on registration of the family.
///
class Controller final
{
public:
    using Failure = libnlwire::detail::AppendType<  //
        session::AnyFailure,
        UnexpectedReplyError,
        MulticastGroupNotFoundError>::Result;

    /// @brief Gets attribute schema of the controller replies.
    ///
    /// Operations and multicast groups are arrays of nests. Could be used as a part of a session schema,
    /// although the controller copes with opaque (raw) nests as well.
    ///
    static const wire::IAttributeSchema& attributeSchema() noexcept
    {
        static const wire::RawAttributeSchema&  leaf = wire::RawAttributeSchema::instance();
        static const wire::ArrayAttributeSchema array_of_nests{leaf};

        static const wire::AttributeSchema::Entry entries[] = {  // NOLINT(*-avoid-c-arrays)
            {Ctrl::Attr::Ops, &array_of_nests},
            {Ctrl::Attr::McastGroups, &array_of_nests},
        };
        static const wire::AttributeSchema schema{entries};
        return schema;
    }

    explicit Controller(session::Session& session) noexcept
        : session_{session}
    {
    }

    /// @brief Resolves a family name to its numeric id.
    ///
    /// Sends `CTRL_CMD_GETFAMILY` request with the `CTRL_ATTR_FAMILY_NAME` attribute,
    /// and takes the `CTRL_ATTR_FAMILY_ID` attribute of the reply.
    ///
    /// @return The family id, or a failure (f.e. `KernelError` with `-ENOENT` code for an unknown family).
    ///         `ArgumentError` is returned (without sending anything) for a name longer than
    ///         `Ctrl::MaxFamilyNameLength`.
    ///
    CETL_NODISCARD Expected<std::uint16_t, Failure> resolveFamily(const cetl::string_view         name,
                                                                  const cetl::optional<TimePoint> deadline = {})
    {
        auto attributes_result = getFamily(name, deadline);
        if (auto* const failure = cetl::get_if<Failure>(&attributes_result))
        {
            return std::move(*failure);
        }
        const auto& attributes = cetl::get<wire::AttributeList>(attributes_result);

        const auto* const id_attr = wire::findAttribute(attributes, Ctrl::Attr::FamilyId);
        const auto        id      = (id_attr != nullptr) ? wire::getU16(*id_attr) : cetl::nullopt;
        if (!id)
        {
            return UnexpectedReplyError{Ctrl::Attr::FamilyId};
        }
        return *id;
    }

    /// @brief Resolves a family name to the whole family description.
    ///
    CETL_NODISCARD Expected<FamilyInfo, Failure> resolveFamilyInfo(const cetl::string_view         name,
                                                                   const cetl::optional<TimePoint> deadline = {})
    {
        auto attributes_result = getFamily(name, deadline);
        if (auto* const failure = cetl::get_if<Failure>(&attributes_result))
        {
            return std::move(*failure);
        }
        return makeFamilyInfo(cetl::get<wire::AttributeList>(attributes_result));
    }

    /// @brief Resolves id of a multicast group of a family.
    ///
    CETL_NODISCARD Expected<std::uint32_t, Failure> resolveMulticastGroup(
        const cetl::string_view         family_name,
        const cetl::string_view         group_name,
        const cetl::optional<TimePoint> deadline = {})
    {
        auto info_result = resolveFamilyInfo(family_name, deadline);
        if (auto* const failure = cetl::get_if<Failure>(&info_result))
        {
            return std::move(*failure);
        }

        for (const auto& group : cetl::get<FamilyInfo>(info_result).multicast_groups)
        {
            if (cetl::string_view{group.name.data(), group.name.size()} == group_name)
            {
                return group.id;
            }
        }
        return MulticastGroupNotFoundError{};
    }

private:
    CETL_NODISCARD Expected<wire::AttributeList, Failure> getFamily(const cetl::string_view         name,
                                                                    const cetl::optional<TimePoint> deadline)
    {
        if (name.size() > Ctrl::MaxFamilyNameLength)
        {
            return ArgumentError{};
        }

        auto& memory = session_.memory();

        wire::AttributeList attributes{wire::AttributeList::allocator_type{&memory}};
        attributes.push_back(wire::makeStringAttribute(memory, Ctrl::Attr::FamilyName, name));

        const wire::Header        header{0, Ctrl::FamilyId, wire::Flags::Request, 0, 0};
        const wire::GenericHeader generic{Ctrl::Cmd::GetFamily, Ctrl::Version, 0};

        auto result = session_.request(wire::makeGenericMessage(header, generic, std::move(attributes)), deadline);
        if (auto* const failure = cetl::get_if<session::AnyFailure>(&result))
        {
            return libnlwire::detail::upcastVariant<Failure>(std::move(*failure));
        }
        auto& exchange = cetl::get<session::ExchangeResult>(result);

        wire::Message* reply = nullptr;
        if (auto* const single = cetl::get_if<session::Single>(&exchange))
        {
            reply = &single->message;
        }
        else
        {
            auto& messages = cetl::get<session::Multi>(exchange).messages;
            reply          = messages.empty() ? nullptr : &messages.front();
        }
        if ((reply == nullptr) || (reply->header.type != Ctrl::FamilyId))
        {
            return UnexpectedReplyError{Ctrl::Attr::FamilyId};
        }

        return replyAttributes(*reply, memory);
    }

    /// Gets attributes of a reply, whatever schema the session has decoded it with.
    ///
    static Expected<wire::AttributeList, Failure> replyAttributes(wire::Message&              reply,
                                                                  cetl::pmr::memory_resource& memory)
    {
        if (auto* const attributes = cetl::get_if<wire::AttributeList>(&reply.payload))
        {
            return std::move(*attributes);
        }

        const auto* const bytes = reply.bytes();
        CETL_DEBUG_ASSERT(bytes != nullptr, "");

        wire::ReadCursor cursor{libnlwire::detail::asSpan(*bytes)};
        if (!reply.generic)
        {
            auto generic_result = wire::decodeGenericHeader(cursor);
            if (auto* const failure = cetl::get_if<wire::DecodeFailure>(&generic_result))
            {
                return libnlwire::detail::upcastVariant<Failure>(std::move(*failure));
            }
        }
        auto attributes_result = wire::decodeAttributes(cursor, cursor.size(), attributeSchema(), memory);
        if (auto* const failure = cetl::get_if<wire::AttributesDecodeFailure>(&attributes_result))
        {
            return libnlwire::detail::upcastVariant<Failure>(std::move(failure->cause));
        }
        return cetl::get<wire::AttributeList>(std::move(attributes_result));
    }

    /// Visits elements of an "array of nests" attribute (each element is a nested list).
    ///
    template <typename Visitor>
    static void visitNests(const wire::Attribute& array, cetl::pmr::memory_resource& memory, Visitor&& visitor)
    {
        wire::AttributeList decoded{wire::AttributeList::allocator_type{&memory}};

        const wire::AttributeList* elements = array.attributes();
        if (elements == nullptr)
        {
            // The nest was left opaque by the session schema - decode it here.
            const auto&      bytes = *array.bytes();
            wire::ReadCursor cursor{libnlwire::detail::asSpan(bytes)};
            const wire::ArrayAttributeSchema array_schema{wire::RawAttributeSchema::instance()};

            auto result = wire::decodeAttributes(cursor, cursor.size(), array_schema, memory);
            if (auto* const failure = cetl::get_if<wire::AttributesDecodeFailure>(&result))
            {
                decoded = std::move(failure->prefix);
            }
            else
            {
                decoded = cetl::get<wire::AttributeList>(std::move(result));
            }
            elements = &decoded;
        }

        for (const auto& element : *elements)
        {
            if (const auto* const nested = element.attributes())
            {
                visitor(*nested);
            }
        }
    }

    Expected<FamilyInfo, Failure> makeFamilyInfo(const wire::AttributeList& attributes) const
    {
        auto& memory = session_.memory();

        const auto* const id_attr = wire::findAttribute(attributes, Ctrl::Attr::FamilyId);
        const auto        id      = (id_attr != nullptr) ? wire::getU16(*id_attr) : cetl::nullopt;
        if (!id)
        {
            return UnexpectedReplyError{Ctrl::Attr::FamilyId};
        }

        FamilyInfo info{*id,
                        PmrString{PmrString::allocator_type{&memory}},
                        0,
                        0,
                        0,
                        PmrVector<Operation>{PmrVector<Operation>::allocator_type{&memory}},
                        PmrVector<MulticastGroup>{PmrVector<MulticastGroup>::allocator_type{&memory}}};

        if (const auto* const name_attr = wire::findAttribute(attributes, Ctrl::Attr::FamilyName))
        {
            if (const auto name = wire::getString(*name_attr))
            {
                info.name.assign(name->data(), name->size());
            }
        }
        info.version       = getU32Or(attributes, Ctrl::Attr::Version, 0);
        info.header_size   = getU32Or(attributes, Ctrl::Attr::HdrSize, 0);
        info.max_attribute = getU32Or(attributes, Ctrl::Attr::MaxAttr, 0);

        if (const auto* const ops_attr = wire::findAttribute(attributes, Ctrl::Attr::Ops))
        {
            visitNests(*ops_attr, memory, [&info](const wire::AttributeList& op) {
                //
                info.operations.push_back(
                    Operation{getU32Or(op, Ctrl::OpAttr::Id, 0), getU32Or(op, Ctrl::OpAttr::Flags, 0)});
            });
        }

        if (const auto* const groups_attr = wire::findAttribute(attributes, Ctrl::Attr::McastGroups))
        {
            visitNests(*groups_attr, memory, [&info, &memory](const wire::AttributeList& group) {
                //
                const auto* const name_attr = wire::findAttribute(group, Ctrl::McastGrpAttr::Name);
                const auto        name      = (name_attr != nullptr) ? wire::getString(*name_attr) : cetl::nullopt;
                if (name)
                {
                    PmrString group_name{name->data(), name->size(), PmrString::allocator_type{&memory}};
                    info.multicast_groups.push_back(
                        MulticastGroup{std::move(group_name), getU32Or(group, Ctrl::McastGrpAttr::Id, 0)});
                }
            });
        }

        return info;
    }

    static std::uint32_t getU32Or(const wire::AttributeList& attributes,
                                  const wire::AttributeType  type,
                                  const std::uint32_t        default_value)
    {
        const auto* const attribute = wire::findAttribute(attributes, type);
        if (attribute == nullptr)
        {
            return default_value;
        }
        if (const auto value = wire::getU32(*attribute))
        {
            return *value;
        }
        return default_value;
    }

    // MARK: Data members:

    session::Session& session_;

};  // Controller

}  // namespace genl
}  // namespace libnlwire

#endif  // LIBNLWIRE_GENL_CONTROLLER_HPP_INCLUDED
