#pragma once

#include "core/engineSignal.hpp"

namespace kifu {

class IEngineSignalListener {
public:
	virtual ~IEngineSignalListener()                 = default;
	virtual void onEngineSignal(EngineSignal signal) = 0;
};

} // namespace kifu
