/*
 * Contextual.cpp
 */

#include "../headers/facet_internal.h"

namespace facet
{
    void reportClosedChain(int state)
    {
        switch (state) {
            case FACET_CHAIN_SUPERSEDED:
                throw ChainTerminated(Message::ChainSuperseded);
            case FACET_CHAIN_FAILED:
                throw ChainTerminated(Message::colon(Message::ChainTerminated) + "a link failed");
            default:
                throw ChainTerminated(Message::ChainTerminated);
        }
    }
}
