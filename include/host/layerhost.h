#ifndef LAYERHOST_H
#define LAYERHOST_H

#include "host/layerdefinition.h"

#include <QString>

/**
 * @brief LayerHost - The host application's layer tree, as seen by the plugin
 *
 * Groups are addressed by name at the root of the layer tree. Failures are
 * reported through the return value and lastError().
 */
class LayerHost {
public:
    virtual ~LayerHost() = default;

    // Find the root-level group `name`, creating it when absent.
    // `created` (optional) tells whether a new group was made.
    virtual bool createOrGetGroup(const QString& name, bool* created = nullptr) = 0;

    // Construct the layer and insert it as the top child of `group`
    virtual bool addLayerToGroup(const QString& group, const LayerDefinition& definition) = 0;

    virtual QString lastError() const = 0;
};

#endif // LAYERHOST_H
