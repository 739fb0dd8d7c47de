#pragma once

namespace CONFIG_FILE_NAME
{
	inline constexpr char SIMULATOR[] = "simulator_config.json";
}
