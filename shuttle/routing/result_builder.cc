// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "shuttle/routing/result_builder.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "shuttle/geo/great_circle.h"
#include "shuttle/routing/distance_provider.h"
#include "shuttle/routing/model.pb.h"
#include "shuttle/routing/parameters.pb.h"
#include "shuttle/routing/problem.h"
#include "shuttle/routing/result.pb.h"
#include "shuttle/routing/route_evaluator.h"
#include "shuttle/routing/solution.h"

namespace shuttle::routing {
namespace {

constexpr absl::string_view kRouteColors[] = {
    "#FF6B6B", "#4ECDC4", "#45B7D1", "#FFA07A", "#98D8C8",
    "#F7DC6F", "#BB8FCE", "#85C1E9", "#F8C471", "#82E0AA"};
constexpr int kNumRouteColors = sizeof(kRouteColors) / sizeof(kRouteColors[0]);

RouteSegment MakeSegment(const GeoPoint& from, const GeoPoint& to,
                         const RouteGeometry& geometry) {
  RouteSegment segment;
  *segment.mutable_from() = from;
  *segment.mutable_to() = to;
  segment.set_distance_km(geometry.total_distance_km);
  segment.set_duration_minutes(geometry.total_duration_minutes);
  for (const GeoPoint& waypoint : geometry.waypoints) {
    *segment.add_waypoints() = waypoint;
  }
  for (const RouteStep& step : geometry.steps) {
    *segment.add_steps() = step;
  }
  return segment;
}

// The distinct spots served by a vehicle with the number of workers picked up
// at each of them.
struct VehicleStops {
  std::vector<int> spots;
  std::vector<int> workers;
};

std::vector<VehicleStops> GroupStopsByVehicle(const Problem& problem,
                                              const Solution& solution) {
  std::vector<VehicleStops> stops(problem.num_vehicles());
  for (const Assignment& assignment : solution.assignments()) {
    VehicleStops& vehicle_stops = stops[assignment.vehicle];
    int index = 0;
    while (index < vehicle_stops.spots.size() &&
           vehicle_stops.spots[index] != assignment.spot) {
      ++index;
    }
    if (index == vehicle_stops.spots.size()) {
      vehicle_stops.spots.push_back(assignment.spot);
      vehicle_stops.workers.push_back(0);
    }
    vehicle_stops.workers[index] += assignment.workers;
  }
  return stops;
}

}  // namespace

absl::string_view GetRouteColor(int route_index) {
  return kRouteColors[route_index % kNumRouteColors];
}

std::vector<RouteSegment> BuildRouteSegments(absl::Span<const GeoPoint> points,
                                             DistanceProvider* road_provider,
                                             double fallback_speed_kmh) {
  std::vector<RouteSegment> segments;
  if (points.size() < 2) return segments;
  if (road_provider != nullptr) {
    const absl::StatusOr<RouteGeometry> geometry =
        road_provider->GetRouteGeometry(points);
    if (geometry.ok() && !geometry->waypoints.empty()) {
      segments.push_back(MakeSegment(points.front(), points.back(), *geometry));
      return segments;
    }
    if (geometry.ok()) {
      LOG(WARNING) << "Road geometry is empty, using straight segments";
    } else {
      LOG(WARNING) << "Road geometry unavailable (" << geometry.status()
                   << "), using straight segments";
    }
  }
  for (int i = 1; i < points.size(); ++i) {
    const GeoPoint& from = points[i - 1];
    const GeoPoint& to = points[i];
    RouteGeometry geometry;
    geometry.total_distance_km = geo::GreatCircleDistanceKm(
        from.latitude(), from.longitude(), to.latitude(), to.longitude());
    geometry.total_duration_minutes =
        geo::TravelMinutes(geometry.total_distance_km, fallback_speed_kmh);
    geometry.waypoints = {from, to};
    segments.push_back(MakeSegment(from, to, geometry));
  }
  return segments;
}

OptimizationResult BuildOptimizationResult(
    const Problem& problem, const Solution& solution,
    const ShuttleSearchParameters& parameters,
    DistanceProvider* road_provider) {
  OptimizationResult result;
  const GeoPoint& factory = problem.model().factory().location();
  DistanceProvider* const geometry_provider =
      parameters.use_real_roads() ? road_provider : nullptr;

  const std::vector<VehicleStops> stops =
      GroupStopsByVehicle(problem, solution);
  for (int v = 0; v < problem.num_vehicles(); ++v) {
    const VehicleStops& vehicle_stops = stops[v];
    if (vehicle_stops.spots.empty()) continue;
    const Vehicle& vehicle = problem.vehicle(v);
    OptimizedRoute* const route = result.add_routes();
    route->set_vehicle_id(vehicle.id());
    route->set_vehicle_name(vehicle.name());
    route->set_vehicle_category(vehicle.category());
    route->set_route_color(
        std::string(GetRouteColor(result.routes_size() - 1)));

    std::vector<GeoPoint> points = {factory};
    int load = 0;
    for (int i = 0; i < vehicle_stops.spots.size(); ++i) {
      const PickupSpot& spot = problem.spot(vehicle_stops.spots[i]);
      const int workers = vehicle_stops.workers[i];
      load += workers;
      RouteStop* const stop = route->add_stops();
      stop->set_spot_id(spot.id());
      stop->set_spot_name(spot.name());
      *stop->mutable_location() = spot.location();
      stop->set_worker_count(workers);
      stop->set_arrival_order(i + 1);
      stop->set_cumulative_load(load);
      stop->set_pickup_details(absl::StrCat("Picked up ", workers, " workers"));
      points.push_back(spot.location());
    }
    points.push_back(factory);

    const double distance =
        NearestNeighborTourDistance(problem.distances(), vehicle_stops.spots);
    route->set_total_distance_km(distance);
    route->set_total_cost(distance * vehicle.cost_per_km());
    route->set_utilization_percent(100.0 * load / vehicle.capacity());
    route->set_max_passengers(load);

    double duration = 0.0;
    for (RouteSegment& segment : BuildRouteSegments(
             points, geometry_provider, parameters.fallback_speed_kmh())) {
      duration += segment.duration_minutes();
      *route->add_route_segments() = std::move(segment);
    }
    route->set_total_duration_minutes(duration);
  }

  result.set_total_distance(solution.total_distance());
  result.set_total_cost(solution.total_cost());
  result.set_total_vehicles_used(solution.vehicles_used());

  const std::vector<int> spot_loads = ComputeSpotLoads(problem, solution);
  int64_t unassigned_workers = 0;
  for (int s = 0; s < problem.num_spots(); ++s) {
    const int missing = problem.spot(s).worker_count() - spot_loads[s];
    if (missing <= 0) continue;
    result.add_unassigned_spot_ids(problem.spot(s).id());
    UnassignedSpot* const unassigned = result.add_unassigned_spots();
    unassigned->set_spot_id(problem.spot(s).id());
    unassigned->set_unassigned_workers(missing);
    unassigned_workers += missing;
  }
  result.set_unassigned_workers(unassigned_workers);
  if (unassigned_workers > 0) {
    LOG(WARNING) << unassigned_workers << " workers at "
                 << result.unassigned_spots_size()
                 << " pickup spots have no seat: the fleet has "
                 << problem.total_capacity() << " seats for "
                 << problem.total_demand() << " workers";
  }
  return result;
}

}  // namespace shuttle::routing
