#ifndef SLOTINGEST_INGEST_CONNECTOR_H
#define SLOTINGEST_INGEST_CONNECTOR_H

#include <slotingest/components/io/types/types.h>
#include <slotingest/ingest/slot.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace slotingest::ingest {

/**
 * @brief Opaque connector settings, passed through unchanged.
 */
using ConnectorParameters = std::map<std::string, std::string>;

/**
 * @brief Read-only access to a remote collection of slots.
 *
 * Both operations may be invoked several times for the same data (retries,
 * repeated cycles) and must not modify the remote side.
 */
class Connector {
   public:
    virtual ~Connector() = default;

    /**
     * @brief List the currently available slots.
     *
     * @throws ListFailure on transient errors
     */
    virtual std::vector<Slot> list() = 0;

    /**
     * @brief Fetch the full content of one slot.
     *
     * @throws FetchFailure on transient errors
     */
    virtual components::io::RawData fetch(const Slot& slot) = 0;
};

/**
 * @brief Creates connectors from their parameters.
 */
class ConnectorFactory {
   public:
    virtual ~ConnectorFactory() = default;

    virtual std::shared_ptr<Connector> create(
        const ConnectorParameters& parameters) = 0;
};

}  // namespace slotingest::ingest

#endif  // SLOTINGEST_INGEST_CONNECTOR_H
