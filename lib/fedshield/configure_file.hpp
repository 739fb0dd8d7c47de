#pragma once

#include <string>
#include <vector>
#include <optional>
#include <fstream>
#include <iterator>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace fedshield
{
	/// json configuration with defaults: keys missing from the loaded file fall back to the default configuration
	class configuration_file
	{
	public:
		using json = nlohmann::json;

		enum load_result
		{
			parse_error = -2,
			io_error = -1,
			loaded = 0,
			created_from_default = 1,
		};

		void SetDefaultConfiguration(const json& default_config)
		{
			_default = default_config;
			_json = default_config;
		}

		/// create the file from the default configuration if it does not exist
		int LoadConfiguration(const std::filesystem::path& path)
		{
			if (!std::filesystem::exists(path))
			{
				std::ofstream file(path, std::ios::binary);
				if (!file) return io_error;
				file << _default.dump(4);
				_json = _default;
				return created_from_default;
			}

			std::ifstream file(path, std::ios::binary);
			if (!file) return io_error;
			std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
			return LoadConfigurationData(content);
		}

		int LoadConfigurationData(const std::string& data)
		{
			json loaded_json = json::parse(data, nullptr, false);
			if (loaded_json.is_discarded() || !loaded_json.is_object()) return parse_error;
			_json = _default.is_object() ? _default : json::object();
			_json.merge_patch(loaded_json);
			return load_result::loaded;
		}

		template<typename T>
		std::optional<T> get(const std::string& key) const
		{
			auto iter = _json.find(key);
			if (iter == _json.end() || iter->is_null()) return {};
			try
			{
				return iter->get<T>();
			}
			catch (const json::type_error&)
			{
				return {};
			}
		}

		template<typename T>
		std::optional<std::vector<T>> get_vec(const std::string& key) const
		{
			auto iter = _json.find(key);
			if (iter == _json.end() || !iter->is_array()) return {};
			std::vector<T> output;
			for (const auto& el : *iter)
			{
				if (el.is_null()) return {};
				try
				{
					output.push_back(el.get<T>());
				}
				catch (const json::type_error&)
				{
					return {};
				}
			}
			return output;
		}

		json& get_json()
		{
			return _json;
		}

		const json& get_json() const
		{
			return _json;
		}

	private:
		json _default = json::object();
		json _json = json::object();
	};
}
