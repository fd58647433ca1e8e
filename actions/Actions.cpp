#include "Actions.hpp"
#include <unistd.h>

namespace lan_warden::actions
{
    bool EffectiveUidCheck::IsElevated() const
    {
        return geteuid() == 0;
    }
}
