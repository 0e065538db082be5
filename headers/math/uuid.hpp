#ifndef BASALT_UUID_HPP
#define BASALT_UUID_HPP


#include <cstdint>
#include <ostream>
#include <string>

class UUID
{
public:
    uint64_t most;
    uint64_t least;

    UUID();

    UUID(uint64_t most, uint64_t least);

    /**
     * The UUID the vanilla server assigns to a player when it does not authenticate them:
     * a version 3 (MD5) name-based UUID of "OfflinePlayer:<username>".
     */
    static UUID offline(const std::string& username);

    /**
     * @return Hyphenated lower case hex, e.g. 2b3414ed-468a-45c2-b113-6c5f47430edc
     */
    [[nodiscard]] std::string to_string() const;

    bool operator==(const UUID& other) const = default;

    friend std::ostream& operator<<(std::ostream& os, const UUID& uuid);
};


#endif //BASALT_UUID_HPP
