#pragma once

#include <string>
#include <vector>

namespace libmotionts {
namespace models {

/**
 * Standard joint-angle channel sets of a BVH skeleton
 *
 * Channel names follow the "<Joint>_<Axis>rotation" convention of BVH
 * motion-capture exports.
 */
struct BodyChannels {
	/// Every joint of the skeleton, X/Y/Z rotation each (57 channels)
	static std::vector<std::string> FullBody() {
		return Expand({"Spine", "Spine1", "Spine2", "Spine3", "Hips", "Neck", "Head", "LeftArm", "LeftForeArm",
		               "RightArm", "RightForeArm", "LeftShoulder", "LeftShoulder2", "RightShoulder",
		               "RightShoulder2", "LeftUpLeg", "LeftLeg", "RightUpLeg", "RightLeg"});
	}

	/// Spine, neck and upper arms (12 channels)
	static std::vector<std::string> UpperBody() {
		return Expand({"Spine", "Neck", "LeftArm", "RightArm"});
	}

	/// Hips and spine (6 channels)
	static std::vector<std::string> Core() {
		return Expand({"Hips", "Spine"});
	}

	/// "<joint>_Xrotation", "<joint>_Yrotation", "<joint>_Zrotation" per joint
	static std::vector<std::string> Expand(const std::vector<std::string> &joints) {
		std::vector<std::string> channels;
		channels.reserve(joints.size() * 3);
		for (const auto &joint : joints) {
			channels.push_back(joint + "_Xrotation");
			channels.push_back(joint + "_Yrotation");
			channels.push_back(joint + "_Zrotation");
		}
		return channels;
	}
};

} // namespace models
} // namespace libmotionts
