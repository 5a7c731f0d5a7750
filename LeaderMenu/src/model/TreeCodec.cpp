#include "model/TreeCodec.h"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "services/keys/KeyMaps.h"

using nlohmann::json;

namespace lmenu::codec {
namespace {

class DecodeError : public std::runtime_error {
public:
	DecodeError(const std::string& where, const std::string& what)
		: std::runtime_error(where.empty() ? what : where + ": " + what) {}
};

std::string childPath(const std::string& parent, std::size_t index) {
	return parent + "actions[" + std::to_string(index) + "]";
}

std::string fieldPath(const std::string& where, const char* field) {
	return where.empty() ? std::string(field) : where + "." + field;
}

// Absent and null both decode to std::nullopt; any other non-string is an error.
std::optional<std::string> optionalString(const json& object, const char* field, const std::string& where) {
	auto it = object.find(field);
	if (it == object.end() || it->is_null()) return std::nullopt;
	if (!it->is_string()) throw DecodeError(fieldPath(where, field), "expected a string");
	return it->get<std::string>();
}

std::optional<std::string> decodeKey(const json& object, const std::string& where) {
	auto key = optionalString(object, "key", where);
	if (!key) return std::nullopt;
	return keys::normalize(*key);
}

std::optional<std::vector<ScriptArgument>> decodeArguments(const json& object, const std::string& where) {
	auto it = object.find("arguments");
	if (it == object.end() || it->is_null()) return std::nullopt;
	const std::string argsPath = fieldPath(where, "arguments");
	if (!it->is_array()) throw DecodeError(argsPath, "expected an array");
	std::vector<ScriptArgument> out;
	out.reserve(it->size());
	for (std::size_t i = 0; i < it->size(); ++i) {
		const json& entry = (*it)[i];
		const std::string entryPath = argsPath + "[" + std::to_string(i) + "]";
		if (!entry.is_object()) throw DecodeError(entryPath, "expected an object");
		auto name = entry.find("name");
		if (name == entry.end() || !name->is_string()) throw DecodeError(fieldPath(entryPath, "name"), "missing required string");
		ScriptArgument arg;
		arg.name = name->get<std::string>();
		arg.defaultValue = optionalString(entry, "defaultValue", entryPath);
		out.push_back(std::move(arg));
	}
	return out;
}

Group decodeGroupBody(const json& object, const std::string& where);

Node decodeNode(const json& object, const std::string& where) {
	if (!object.is_object()) throw DecodeError(where, "expected an object");
	auto typeIt = object.find("type");
	if (typeIt == object.end() || !typeIt->is_string()) {
		throw DecodeError(fieldPath(where, "type"), "missing required string");
	}
	const std::string typeName = typeIt->get<std::string>();
	if (typeName == "group") {
		return Node(decodeGroupBody(object, where));
	}
	auto type = actionTypeFromString(typeName);
	if (!type) throw DecodeError(fieldPath(where, "type"), "unknown type '" + typeName + "'");

	auto valueIt = object.find("value");
	if (valueIt == object.end() || !valueIt->is_string()) {
		throw DecodeError(fieldPath(where, "value"), "missing required string");
	}
	Action action;
	action.key = decodeKey(object, where);
	action.type = *type;
	action.label = optionalString(object, "label", where);
	action.value = valueIt->get<std::string>();
	action.iconPath = optionalString(object, "iconPath", where);
	action.openWith = optionalString(object, "openWith", where);
	action.arguments = decodeArguments(object, where);
	return Node(std::move(action));
}

Group decodeGroupBody(const json& object, const std::string& where) {
	auto actionsIt = object.find("actions");
	if (actionsIt == object.end() || !actionsIt->is_array()) {
		throw DecodeError(fieldPath(where, "actions"), "missing required array");
	}
	Group group;
	group.key = decodeKey(object, where);
	group.label = optionalString(object, "label", where);
	group.iconPath = optionalString(object, "iconPath", where);
	group.children.reserve(actionsIt->size());
	const std::string prefix = where.empty() ? std::string{} : where + ".";
	for (std::size_t i = 0; i < actionsIt->size(); ++i) {
		group.children.push_back(decodeNode((*actionsIt)[i], childPath(prefix, i)));
	}
	return group;
}

void encodeCommon(json& out, const std::optional<std::string>& key, const std::optional<std::string>& label,
                  const std::optional<std::string>& iconPath) {
	if (key) out["key"] = keys::toTextual(*key);
	if (label && !label->empty()) out["label"] = *label;
	if (iconPath) out["iconPath"] = *iconPath;
}

} // namespace

json encodeNode(const Node& node) {
	if (const auto* group = node.group()) {
		return encodeGroup(*group);
	}
	const Action& action = *node.action();
	json out = json::object();
	encodeCommon(out, action.key, action.label, action.iconPath);
	out["type"] = toString(action.type);
	out["value"] = action.value;
	if (action.openWith) out["openWith"] = *action.openWith;
	if (action.arguments && !action.arguments->empty()) {
		json args = json::array();
		for (const auto& arg : *action.arguments) {
			json entry = json::object();
			entry["name"] = arg.name;
			if (arg.defaultValue) entry["defaultValue"] = *arg.defaultValue;
			args.push_back(std::move(entry));
		}
		out["arguments"] = std::move(args);
	}
	return out;
}

json encodeGroup(const Group& group) {
	json out = json::object();
	encodeCommon(out, group.key, group.label, group.iconPath);
	out["type"] = "group";
	json children = json::array();
	for (const auto& child : group.children) {
		children.push_back(encodeNode(child));
	}
	out["actions"] = std::move(children);
	return out;
}

std::string encodeTree(const Group& root) {
	return encodeGroup(root).dump(kIndent);
}

std::optional<Group> decodeDocument(const json& document, std::string* outError) {
	try {
		if (!document.is_object()) throw DecodeError("", "root must be an object");
		auto typeIt = document.find("type");
		if (typeIt != document.end() && !(typeIt->is_string() && typeIt->get<std::string>() == "group")) {
			throw DecodeError("type", "root must be a group");
		}
		return decodeGroupBody(document, "");
	} catch (const DecodeError& e) {
		if (outError) *outError = e.what();
		return std::nullopt;
	} catch (const json::exception& e) {
		if (outError) *outError = e.what();
		return std::nullopt;
	}
}

std::optional<Group> decodeTree(std::string_view text, std::string* outError) {
	json document;
	try {
		document = json::parse(text.begin(), text.end());
	} catch (const json::parse_error& e) {
		if (outError) *outError = e.what();
		return std::nullopt;
	}
	return decodeDocument(document, outError);
}

} // namespace lmenu::codec
