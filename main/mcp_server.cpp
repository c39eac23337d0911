#include "mcp_server.hpp"
#include "esp_log.h"
#include "cJSON.h"
#include <cstdlib>

static const char *TAG = "McpServer";

const char* McpServer::PROTOCOL_VERSION = "2024-11-05";
const char* McpServer::SERVER_NAME = "sensecap-ha-gateway";
const char* McpServer::SERVER_VERSION = "1.0.0";

// Takes ownership of result
static std::string buildResponse(const cJSON* id, cJSON* result) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "jsonrpc", "2.0");
    if (id) {
        cJSON_AddItemToObject(root, "id", cJSON_Duplicate(id, true));
    } else {
        cJSON_AddNullToObject(root, "id");
    }
    cJSON_AddItemToObject(root, "result", result);

    std::string text;
    char* json_string = cJSON_PrintUnformatted(root);
    if (json_string) {
        text = json_string;
        free(json_string);
    }
    cJSON_Delete(root);
    return text;
}

static cJSON* buildInitializeResult() {
    cJSON* result = cJSON_CreateObject();
    cJSON_AddStringToObject(result, "protocolVersion", McpServer::PROTOCOL_VERSION);
    cJSON* capabilities = cJSON_AddObjectToObject(result, "capabilities");
    cJSON* tools = cJSON_AddObjectToObject(capabilities, "tools");
    cJSON_AddBoolToObject(tools, "listChanged", false);
    cJSON* info = cJSON_AddObjectToObject(result, "serverInfo");
    cJSON_AddStringToObject(info, "name", McpServer::SERVER_NAME);
    cJSON_AddStringToObject(info, "version", McpServer::SERVER_VERSION);
    return result;
}

static cJSON* buildToolsListResult(const std::vector<ToolDescriptor>& descriptors) {
    cJSON* result = cJSON_CreateObject();
    cJSON* tools = cJSON_AddArrayToObject(result, "tools");
    for (const auto& descriptor : descriptors) {
        cJSON* tool = cJSON_CreateObject();
        cJSON_AddStringToObject(tool, "name", descriptor.name.c_str());
        cJSON_AddStringToObject(tool, "description", descriptor.description.c_str());
        cJSON* schema = cJSON_Parse(descriptor.input_schema.c_str());
        if (!cJSON_IsObject(schema)) {
            ESP_LOGW(TAG, "Tool %s has an invalid input schema", descriptor.name.c_str());
            cJSON_Delete(schema);
            schema = cJSON_CreateObject();
            cJSON_AddStringToObject(schema, "type", "object");
        }
        cJSON_AddItemToObject(tool, "inputSchema", schema);
        cJSON_AddItemToArray(tools, tool);
    }
    return result;
}

static cJSON* buildToolCallResult(const std::string& text, bool is_error) {
    cJSON* result = cJSON_CreateObject();
    cJSON* content = cJSON_AddArrayToObject(result, "content");
    cJSON* block = cJSON_CreateObject();
    cJSON_AddStringToObject(block, "type", "text");
    cJSON_AddStringToObject(block, "text", text.c_str());
    cJSON_AddItemToArray(content, block);
    cJSON_AddBoolToObject(result, "isError", is_error);
    return result;
}

McpServer::McpServer(ToolExecutor& tools)
    : tools_(tools)
    , handshake_complete_(false)
{
}

bool McpServer::handle(const std::string& text, std::string& reply) {
    cJSON* root = cJSON_Parse(text.c_str());
    if (!cJSON_IsObject(root)) {
        ESP_LOGW(TAG, "Invalid JSON from broker: %.200s", text.c_str());
        cJSON_Delete(root);
        return false;
    }

    const cJSON* id = cJSON_GetObjectItem(root, "id");
    cJSON* method_item = cJSON_GetObjectItem(root, "method");
    std::string method = cJSON_IsString(method_item) ? method_item->valuestring : "";
    bool has_reply = false;

    if (method == "initialize") {
        cJSON* params = cJSON_GetObjectItem(root, "params");
        cJSON* client_info = cJSON_GetObjectItem(params, "clientInfo");
        cJSON* client_name = cJSON_GetObjectItem(client_info, "name");
        ESP_LOGI(TAG, "MCP initialize from: %s",
                 cJSON_IsString(client_name) ? client_name->valuestring : "unknown client");
        reply = buildResponse(id, buildInitializeResult());
        has_reply = true;
    } else if (method == "notifications/initialized") {
        handshake_complete_ = true;
        ESP_LOGI(TAG, "MCP handshake complete");
    } else if (method == "tools/list") {
        std::vector<ToolDescriptor> descriptors = tools_.describeTools();
        reply = buildResponse(id, buildToolsListResult(descriptors));
        has_reply = true;
        ESP_LOGI(TAG, "Sent %zu tools to broker", descriptors.size());
    } else if (method == "tools/call") {
        cJSON* params = cJSON_GetObjectItem(root, "params");
        cJSON* name_item = cJSON_GetObjectItem(params, "name");
        cJSON* args_item = cJSON_GetObjectItem(params, "arguments");
        std::string name = cJSON_IsString(name_item) ? name_item->valuestring : "";

        std::string arguments = "{}";
        if (cJSON_IsObject(args_item)) {
            char* args_json = cJSON_PrintUnformatted(args_item);
            if (args_json) {
                arguments = args_json;
                free(args_json);
            }
        }

        ESP_LOGI(TAG, "Tool call: %s(%.200s)", name.c_str(), arguments.c_str());
        std::string result;
        std::string error;
        esp_err_t ret = tools_.execute(name, arguments, result, error);
        if (ret == ESP_OK) {
            ESP_LOGI(TAG, "Tool %s result: %.200s", name.c_str(), result.c_str());
            reply = buildResponse(id, buildToolCallResult(result, false));
        } else {
            if (error.empty()) {
                error = esp_err_to_name(ret);
            }
            ESP_LOGE(TAG, "Tool %s failed: %s", name.c_str(), error.c_str());
            reply = buildResponse(id, buildToolCallResult("Error: " + error, true));
        }
        has_reply = true;
    } else if (method == "ping") {
        reply = buildResponse(id, cJSON_CreateObject());
        has_reply = true;
    } else if (cJSON_HasObjectItem(root, "result") || cJSON_HasObjectItem(root, "error")) {
        // Reply to something we sent
    } else {
        ESP_LOGD(TAG, "Unknown MCP method: %s", method.c_str());
    }

    cJSON_Delete(root);
    return has_reply;
}
