#pragma once

#include <nlohmann/json.hpp>

#include <compare>
#include <cstdint>
#include <functional>
#include <string>

namespace Ids
{
    class Id
    {
      public:
        Id(Id const&) = default;
        Id(Id&&) = default;
        Id& operator=(Id const&) = default;
        Id& operator=(Id&&) = default;
        ~Id() = default;

        auto operator*() const
        {
            return id_;
        }

        std::uint64_t value() const
        {
            return id_;
        }

        std::string toString() const
        {
            return std::to_string(id_);
        }

        friend std::strong_ordering operator<=>(Id const& lhs, Id const& rhs) = default;

        bool isValid() const
        {
            return id_ != 0;
        }

      protected:
        Id() = delete;
        explicit Id(std::uint64_t id)
            : id_{id}
        {}

      private:
        std::uint64_t id_;
    };

    struct IdHash
    {
        template <typename T>
        std::size_t operator()(T const& id) const
        {
            return std::hash<std::uint64_t>{}(id.value());
        }
    };

    /**
     * @brief Hands out strictly increasing ids of one type, starting at 1.
     * 0 is reserved for invalid ids.
     */
    template <typename IdType>
    class IdAllocator
    {
      public:
        IdType next()
        {
            return IdType::fromValue(++last_);
        }

        std::uint64_t allocated() const
        {
            return last_;
        }

      private:
        std::uint64_t last_{0};
    };
}

#define DEFINE_ID_TYPE(name) \
    namespace Ids \
    { \
        class name : public Id \
        { \
          public: \
            friend class IdAllocator<name>; \
            friend name make##name(std::uint64_t); \
\
          public: \
            name() \
                : Id{0} \
            {} \
\
          private: \
            explicit name(std::uint64_t value) \
                : Id{value} \
            {} \
            static name fromValue(std::uint64_t value) \
            { \
                return name{value}; \
            } \
        }; \
\
        inline name make##name(std::uint64_t value) \
        { \
            return name{value}; \
        } \
        inline void to_json(nlohmann::json& j, name const& id) \
        { \
            j = id.value(); \
        } \
        inline void from_json(nlohmann::json const& j, name& id) \
        { \
            id = make##name(j.get<std::uint64_t>()); \
        } \
    }
