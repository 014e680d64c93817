#include "pinsim/config/TableLoader.hpp"

#include <cstdint>
#include <exception>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace pinsim::config
{
namespace
{
using json = nlohmann::json;

void SetError(std::string* outError, const std::string& message)
{
    if (outError != nullptr)
    {
        *outError = message;
    }
}

json Vec2ToJson(const glm::vec2& value)
{
    return json::array({value.x, value.y});
}

json Vec3ToJson(const glm::vec3& value)
{
    return json::array({value.x, value.y, value.z});
}

glm::vec2 Vec2FromJson(const json& value, const glm::vec2& fallback)
{
    if (!value.is_array() || value.size() != 2)
    {
        return fallback;
    }
    return glm::vec2{value.at(0).get<float>(), value.at(1).get<float>()};
}

glm::vec3 Vec3FromJson(const json& value, const glm::vec3& fallback)
{
    if (!value.is_array() || value.size() != 3)
    {
        return fallback;
    }
    return glm::vec3{
        value.at(0).get<float>(),
        value.at(1).get<float>(),
        value.at(2).get<float>(),
    };
}

std::vector<scene::DragPoint> DragPointsFromJson(const json& value)
{
    std::vector<scene::DragPoint> points;
    if (!value.is_array())
    {
        return points;
    }
    for (const json& item : value)
    {
        scene::DragPoint point;
        point.center = Vec3FromJson(item.value("center", json::array()), point.center);
        point.isSmooth = item.value("smooth", point.isSmooth);
        point.isSlingshot = item.value("slingshot", point.isSlingshot);
        point.isLocked = item.value("locked", point.isLocked);
        points.push_back(point);
    }
    return points;
}

json DragPointsToJson(const std::vector<scene::DragPoint>& points)
{
    json result = json::array();
    for (const scene::DragPoint& point : points)
    {
        result.push_back({
            {"center", Vec3ToJson(point.center)},
            {"smooth", point.isSmooth},
            {"slingshot", point.isSlingshot},
            {"locked", point.isLocked},
        });
    }
    return result;
}

core::SimulationConfig SimulationFromJson(const json& node)
{
    core::SimulationConfig config;
    config.globalDifficulty = node.value("global_difficulty", config.globalDifficulty);
    config.globalScatter = node.value("global_scatter", config.globalScatter);
    if (node.contains("seed") && node["seed"].is_number_integer())
    {
        config.seed = node["seed"].get<std::uint32_t>();
    }
    config.fixedStepSeconds = node.value("fixed_step_seconds", config.fixedStepSeconds);
    config.colliderMargin = node.value("collider_margin", config.colliderMargin);
    config.colliderCellSize = node.value("collider_cell_size", config.colliderCellSize);
    return config;
}

scene::KickerData KickerFromJson(const json& node)
{
    scene::KickerData data;
    data.name = node.value("name", data.name);
    data.center = Vec2FromJson(node.value("center", json::array()), data.center);
    data.positionZ = node.value("position_z", data.positionZ);
    data.radius = node.value("radius", data.radius);
    data.scatter = node.value("scatter", data.scatter);
    data.hitHeight = node.value("hit_height", data.hitHeight);
    data.legacyMode = node.value("legacy_mode", data.legacyMode);
    data.fallThrough = node.value("fall_through", data.fallThrough);

    const json coils = node.value("coils", json::array());
    for (const json& item : coils)
    {
        scene::KickerCoilData coil;
        coil.id = item.value("id", coil.id);
        coil.angle = item.value("angle", coil.angle);
        coil.speed = item.value("speed", coil.speed);
        coil.inclination = item.value("inclination", coil.inclination);
        data.coils.push_back(coil);
    }
    return data;
}

scene::PlungerData PlungerFromJson(const json& node)
{
    scene::PlungerData data;
    data.name = node.value("name", data.name);
    data.center = Vec2FromJson(node.value("center", json::array()), data.center);
    data.width = node.value("width", data.width);
    data.height = node.value("height", data.height);
    data.zAdjust = node.value("z_adjust", data.zAdjust);
    data.stroke = node.value("stroke", data.stroke);
    data.parkPosition = node.value("park_position", data.parkPosition);
    data.speedPull = node.value("speed_pull", data.speedPull);
    data.mechStrength = node.value("mech_strength", data.mechStrength);
    data.mass = node.value("mass", data.mass);
    data.momentumXfer = node.value("momentum_xfer", data.momentumXfer);
    data.scatterVelocity = node.value("scatter_velocity", data.scatterVelocity);
    data.retractDistance = node.value("retract_distance", data.retractDistance);
    data.retractWaitSeconds = node.value("retract_wait_seconds", data.retractWaitSeconds);
    data.isMechPlunger = node.value("is_mech_plunger", data.isMechPlunger);
    data.isAutoPlunger = node.value("is_auto_plunger", data.isAutoPlunger);
    data.doRetract = node.value("do_retract", data.doRetract);
    return data;
}

scene::RampData RampFromJson(const json& node)
{
    scene::RampData data;
    data.name = node.value("name", data.name);
    data.dragPoints = DragPointsFromJson(node.value("drag_points", json::array()));
    data.heightBottom = node.value("height_bottom", data.heightBottom);
    data.heightTop = node.value("height_top", data.heightTop);
    data.widthBottom = node.value("width_bottom", data.widthBottom);
    data.widthTop = node.value("width_top", data.widthTop);
    data.leftWallHeight = node.value("left_wall_height", data.leftWallHeight);
    data.rightWallHeight = node.value("right_wall_height", data.rightWallHeight);
    data.playfieldHeight = node.value("playfield_height", data.playfieldHeight);
    data.accuracy = node.value("accuracy", data.accuracy);
    data.hitEvent = node.value("hit_event", data.hitEvent);
    data.threshold = node.value("threshold", data.threshold);
    data.elasticity = node.value("elasticity", data.elasticity);
    data.friction = node.value("friction", data.friction);
    data.scatter = node.value("scatter", data.scatter);
    return data;
}

scene::RubberData RubberFromJson(const json& node)
{
    scene::RubberData data;
    data.name = node.value("name", data.name);
    data.dragPoints = DragPointsFromJson(node.value("drag_points", json::array()));
    data.height = node.value("height", data.height);
    data.thickness = node.value("thickness", data.thickness);
    data.accuracy = node.value("accuracy", data.accuracy);
    data.hitEvent = node.value("hit_event", data.hitEvent);
    data.threshold = node.value("threshold", data.threshold);
    data.overwritePhysics = node.value("overwrite_physics", data.overwritePhysics);
    data.elasticity = node.value("elasticity", data.elasticity);
    data.elasticityFalloff = node.value("elasticity_falloff", data.elasticityFalloff);
    data.friction = node.value("friction", data.friction);
    data.scatter = node.value("scatter", data.scatter);
    return data;
}

wiring::WireMapping WireFromJson(const json& node)
{
    wiring::WireMapping wire;
    wire.id = node.value("id", wire.id);
    wire.sourceDevice = node.value("source_device", wire.sourceDevice);
    wire.sourceSwitch = node.value("source_switch", wire.sourceSwitch);
    wire.destDevice = node.value("dest_device", wire.destDevice);
    wire.destItem = node.value("dest_item", wire.destItem);
    wire.pulse = node.value("pulse", wire.pulse);
    return wire;
}

template <typename T, typename Parser>
void ParseArray(const json& root, const char* key, std::vector<T>& out, Parser parser)
{
    const json items = root.value(key, json::array());
    if (!items.is_array())
    {
        throw std::runtime_error(std::string{key} + " must be an array");
    }
    for (const json& item : items)
    {
        out.push_back(parser(item));
    }
}
} // namespace

bool ParseTableJson(const std::string& text, TableDefinition* outTable, std::string* outError)
{
    if (outTable == nullptr)
    {
        SetError(outError, "ParseTableJson called with null outTable.");
        return false;
    }

    try
    {
        const json root = json::parse(text);
        if (!root.is_object())
        {
            SetError(outError, "Table JSON root must be an object");
            return false;
        }

        const int version = root.value("asset_version", -1);
        if (version != kTableAssetVersion)
        {
            std::ostringstream oss;
            oss << "Unsupported table asset version. Expected " << kTableAssetVersion << ", got " << version;
            SetError(outError, oss.str());
            return false;
        }

        TableDefinition table;
        table.assetVersion = version;
        table.simulation = SimulationFromJson(root.value("simulation", json::object()));
        ParseArray(root, "kickers", table.kickers, KickerFromJson);
        ParseArray(root, "plungers", table.plungers, PlungerFromJson);
        ParseArray(root, "ramps", table.ramps, RampFromJson);
        ParseArray(root, "rubbers", table.rubbers, RubberFromJson);
        ParseArray(root, "wires", table.wires, WireFromJson);

        *outTable = std::move(table);
    }
    catch (const std::exception& ex)
    {
        SetError(outError, std::string{"Invalid table JSON: "} + ex.what());
        return false;
    }
    return true;
}

bool LoadTableFromJsonFile(const std::string& path, TableDefinition* outTable, std::string* outError)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        SetError(outError, "Cannot open table file: " + path);
        return false;
    }

    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return ParseTableJson(buffer.str(), outTable, outError);
}

std::string TableToJsonString(const TableDefinition& table)
{
    json root;
    root["asset_version"] = kTableAssetVersion;

    const core::SimulationConfig& sim = table.simulation;
    root["simulation"] = {
        {"global_difficulty", sim.globalDifficulty},
        {"global_scatter", sim.globalScatter},
        {"fixed_step_seconds", sim.fixedStepSeconds},
        {"collider_margin", sim.colliderMargin},
        {"collider_cell_size", sim.colliderCellSize},
    };
    if (sim.seed.has_value())
    {
        root["simulation"]["seed"] = *sim.seed;
    }

    root["kickers"] = json::array();
    for (const scene::KickerData& data : table.kickers)
    {
        json coils = json::array();
        for (const scene::KickerCoilData& coil : data.coils)
        {
            coils.push_back({{"id", coil.id}, {"angle", coil.angle}, {"speed", coil.speed}, {"inclination", coil.inclination}});
        }
        root["kickers"].push_back({
            {"name", data.name},
            {"center", Vec2ToJson(data.center)},
            {"position_z", data.positionZ},
            {"radius", data.radius},
            {"scatter", data.scatter},
            {"hit_height", data.hitHeight},
            {"legacy_mode", data.legacyMode},
            {"fall_through", data.fallThrough},
            {"coils", coils},
        });
    }

    root["plungers"] = json::array();
    for (const scene::PlungerData& data : table.plungers)
    {
        root["plungers"].push_back({
            {"name", data.name},
            {"center", Vec2ToJson(data.center)},
            {"width", data.width},
            {"height", data.height},
            {"z_adjust", data.zAdjust},
            {"stroke", data.stroke},
            {"park_position", data.parkPosition},
            {"speed_pull", data.speedPull},
            {"mech_strength", data.mechStrength},
            {"mass", data.mass},
            {"momentum_xfer", data.momentumXfer},
            {"scatter_velocity", data.scatterVelocity},
            {"retract_distance", data.retractDistance},
            {"retract_wait_seconds", data.retractWaitSeconds},
            {"is_mech_plunger", data.isMechPlunger},
            {"is_auto_plunger", data.isAutoPlunger},
            {"do_retract", data.doRetract},
        });
    }

    root["ramps"] = json::array();
    for (const scene::RampData& data : table.ramps)
    {
        root["ramps"].push_back({
            {"name", data.name},
            {"drag_points", DragPointsToJson(data.dragPoints)},
            {"height_bottom", data.heightBottom},
            {"height_top", data.heightTop},
            {"width_bottom", data.widthBottom},
            {"width_top", data.widthTop},
            {"left_wall_height", data.leftWallHeight},
            {"right_wall_height", data.rightWallHeight},
            {"playfield_height", data.playfieldHeight},
            {"accuracy", data.accuracy},
            {"hit_event", data.hitEvent},
            {"threshold", data.threshold},
            {"elasticity", data.elasticity},
            {"friction", data.friction},
            {"scatter", data.scatter},
        });
    }

    root["rubbers"] = json::array();
    for (const scene::RubberData& data : table.rubbers)
    {
        root["rubbers"].push_back({
            {"name", data.name},
            {"drag_points", DragPointsToJson(data.dragPoints)},
            {"height", data.height},
            {"thickness", data.thickness},
            {"accuracy", data.accuracy},
            {"hit_event", data.hitEvent},
            {"threshold", data.threshold},
            {"overwrite_physics", data.overwritePhysics},
            {"elasticity", data.elasticity},
            {"elasticity_falloff", data.elasticityFalloff},
            {"friction", data.friction},
            {"scatter", data.scatter},
        });
    }

    root["wires"] = json::array();
    for (const wiring::WireMapping& wire : table.wires)
    {
        root["wires"].push_back({
            {"id", wire.id},
            {"source_device", wire.sourceDevice},
            {"source_switch", wire.sourceSwitch},
            {"dest_device", wire.destDevice},
            {"dest_item", wire.destItem},
            {"pulse", wire.pulse},
        });
    }

    return root.dump(2);
}

bool SaveTableToJsonFile(const std::string& path, const TableDefinition& table, std::string* outError)
{
    std::ofstream stream(path);
    if (!stream.is_open())
    {
        SetError(outError, "Cannot write table file: " + path);
        return false;
    }
    stream << TableToJsonString(table) << "\n";
    return true;
}
} // namespace pinsim::config
