#pragma once
#include "manoid/core/common/constants.hpp"
#include "manoid/core/common/status.hpp"
#include "manoid/core/math/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace manoid::core {

// Serial limb of a humanoid for product-of-exponentials kinematics. Joint i
// moves link i, and every link has a unique name it is looked up by.
// - Axes and axis points are in the base frame at q=0.
// - `link_home` is the base -> link transform at q=0.
// - `S_space` holds the 6 x n space screw axes, [v; w].
// - Fixed joints keep a zero screw axis; they still count in dof().
enum class JointType : std::uint8_t {
  Revolute = 0,
  Prismatic = 1,
  Fixed = 2
};

struct JointLimit {
  double lower = 0.0;
  double upper = 0.0;
  bool enabled = false;
};

struct JointSpec {
  std::string name;
  std::string link_name;
  JointType type{JointType::Revolute};

  Vec3 axis = Vec3::UnitZ();
  Vec3 point = Vec3::Zero();

  JointLimit limit{};
  Transform link_home = Transform::Identity();
};

class RobotModel {
public:
  RobotModel() = default;

  Status init(std::vector<JointSpec> joints,
              const Thresholds& thr = kDefaultThresholds);

  int dof() const { return static_cast<int>(joints_.size()); }

  const std::vector<JointSpec>& joints() const { return joints_; }
  const JointSpec& joint(int i) const { return joints_.at(static_cast<size_t>(i)); }

  const std::vector<std::string>& joint_names() const { return joint_names_; }
  const std::vector<std::string>& link_names() const { return link_names_; }
  Status linkIndex(const std::string& link_name, int* out) const;

  const Transform& base_offset() const { return base_offset_; }
  bool has_base_offset() const { return has_base_offset_; }
  void set_base_offset(const Transform& base_offset) {
    base_offset_ = base_offset;
    has_base_offset_ = !base_offset_.isApprox(Transform::Identity(), 1e-12);
  }
  const ScrewMatrix& S_space() const { return S_space_; }

  Status validate(const Thresholds& thr = kDefaultThresholds) const;
  Status clamp_to_limits(const Eigen::VectorXd& q, Eigen::VectorXd* out) const;

private:
  void clear();

  std::vector<JointSpec> joints_;
  std::vector<std::string> joint_names_;
  std::vector<std::string> link_names_;
  std::unordered_map<std::string, int> link_index_;

  Transform base_offset_{Transform::Identity()};  // world -> base (fixed)
  bool has_base_offset_{false};
  ScrewMatrix S_space_;
};

class RobotBuilder {
public:
  RobotBuilder& set_base_offset(const Transform& base_offset) {
    base_offset_ = base_offset;
    return *this;
  }

  RobotBuilder& add_revolute(std::string name,
                             std::string link_name,
                             const Vec3& w_unit,
                             const Vec3& q_point,
                             Transform link_home,
                             JointLimit limit = {});

  RobotBuilder& add_prismatic(std::string name,
                              std::string link_name,
                              const Vec3& v_unit,
                              Transform link_home,
                              JointLimit limit = {});

  RobotBuilder& add_fixed(std::string name,
                          std::string link_name,
                          Transform link_home);

  Status build(RobotModel* out, const Thresholds& thr = kDefaultThresholds) const;

private:
  RobotBuilder& add(JointType type, std::string name, std::string link_name,
                    const Vec3& axis, const Vec3& point,
                    Transform link_home, JointLimit limit);

  std::vector<JointSpec> joints_;
  std::optional<Transform> base_offset_;
};

}  // namespace manoid::core
