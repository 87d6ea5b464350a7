#pragma once

#include "lib_utils/small_map.hpp"
#include <string>
#include <vector>

namespace json {

struct Value {
		enum class Type {
			String,
			Object,
			Array,
			Integer,
			Boolean,
			Null,
		};

		Type type = Type::Null;

		////////////////////////////////////////
		// type == Type::String
		std::string stringValue;

		operator std::string() const {
			enforceType(Type::String);
			return stringValue;
		}

		////////////////////////////////////////
		// type == Type::Object
		SmallMap<std::string, Value> objectValue;

		Value const& operator[] (const char* name) const;
		bool has(const char* name) const;

		////////////////////////////////////////
		// type == Type::Array
		std::vector<Value> arrayValue;

		Value const& operator[] (int i) const;

		////////////////////////////////////////
		// type == Type::Boolean
		bool boolValue {};

		////////////////////////////////////////
		// type == Type::Integer
		int intValue {};

		operator int() const {
			enforceType(Type::Integer);
			return intValue;
		}

	private:
		void enforceType(Type expected) const;
};

// 's' must hold a single object. Throws std::runtime_error on any syntax error.
Value parse(const std::string &s);
}
