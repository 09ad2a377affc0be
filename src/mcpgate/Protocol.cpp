//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Plain-data (JSON) forms of protocol structures
//==========================================================================================================

#include "mcpgate/Protocol.h"

namespace mcpgate {

JSONValue SerializeServerCapabilities(const ServerCapabilities& caps) {
    JSONValue::Object obj;
    if (caps.tools.has_value()) {
        JSONValue::Object tools;
        tools["listChanged"] = std::make_shared<JSONValue>(caps.tools->listChanged);
        obj["tools"] = std::make_shared<JSONValue>(std::move(tools));
    }
    return JSONValue(std::move(obj));
}

JSONValue SerializeTool(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    if (tool.inputSchema.IsNull()) {
        JSONValue::Object schema;
        schema["type"] = std::make_shared<JSONValue>("object");
        schema["properties"] = std::make_shared<JSONValue>(JSONValue::Object{});
        obj["inputSchema"] = std::make_shared<JSONValue>(std::move(schema));
    } else {
        obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    }
    if (tool.title.has_value()) {
        obj["title"] = std::make_shared<JSONValue>(tool.title.value());
    }
    if (tool.annotations.has_value()) {
        obj["annotations"] = std::make_shared<JSONValue>(tool.annotations.value());
    }
    return JSONValue(std::move(obj));
}

JSONValue MakeTextContent(const std::string& text) {
    JSONValue::Object content;
    content["type"] = std::make_shared<JSONValue>("text");
    content["text"] = std::make_shared<JSONValue>(text);
    return JSONValue(std::move(content));
}

JSONValue MakeObjectSchema(const std::vector<std::pair<std::string, std::string>>& properties) {
    JSONValue::Object props;
    JSONValue::Array required;
    for (const auto& [name, type] : properties) {
        JSONValue::Object prop;
        prop["type"] = std::make_shared<JSONValue>(type);
        props[name] = std::make_shared<JSONValue>(std::move(prop));
        required.push_back(std::make_shared<JSONValue>(name));
    }
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    schema["properties"] = std::make_shared<JSONValue>(std::move(props));
    schema["required"] = std::make_shared<JSONValue>(std::move(required));
    return JSONValue(std::move(schema));
}

} // namespace mcpgate
