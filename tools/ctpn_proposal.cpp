#include <fstream>
#include <gflags/gflags.h>
#include <glog/logging.h>
#include "boost/filesystem.hpp"
#include "boost/random/random_device.hpp"
#include "ctpn/common.hpp"
#include "ctpn/RPN/util/rpn_param.hpp"
#include "ctpn/RPN/util/rpn_utils.hpp"
#include "ctpn/RPN/rpn_head.hpp"

DEFINE_string(default_c, "",
    "Optional;Default config file path, built-in defaults when empty.");
DEFINE_string(rpn_dir, "",
    "Directory of dumped rpn branch outputs (*.rpn).");
DEFINE_string(out_file, "",
    "Output proposals file.");
DEFINE_string(test_mode, "",
    "Optional;Override test_mode of the config, nms or top.");
DEFINE_bool(train, false,
    "Optional;Run in TRAIN mode, dumps carry gt boxes and losses are reported.");

using ctpn::Rpn::FeatureMap;
using ctpn::Rpn::GtBox;
using ctpn::Rpn::ImageInfo;
using ctpn::Rpn::Proposal;
using ctpn::Rpn::RegionProposalHead;
using ctpn::Rpn::RpnOutput;
using ctpn::Rpn::RpnParam;

inline int INT(float x) { return int(x); };
inline std::string FloatToString(float x) { char A[100]; snprintf(A, sizeof(A), "%.8f", x); return std::string(A); };

int main(int argc, char** argv){
  // Print output to stderr (while still logging).
  FLAGS_alsologtostderr = 1;
  // Usage message.
  gflags::SetUsageMessage("command line brew\n"
      "usage: ctpn_proposal <args>\n\n"
      "args:\n"
      "  --default_c    file    Default Config File\n"
      "  --rpn_dir      dir     dumped rpn outputs (*.rpn)\n"
      "  --out_file     file    output proposal file\n"
      "  --test_mode    mode    nms or top, overrides the config\n"
      "  --train                TRAIN mode, dumps carry gt boxes");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  CHECK(!FLAGS_rpn_dir.empty()) << "--rpn_dir is required";
  CHECK(!FLAGS_out_file.empty()) << "--out_file is required";

  std::string default_config_file = FLAGS_default_c.c_str();
  std::string rpn_dir = FLAGS_rpn_dir.c_str();
  std::string out_file = FLAGS_out_file.c_str();

  RpnParam param;
  if (!default_config_file.empty()) {
    param.load_param(default_config_file);
  }
  if (!FLAGS_test_mode.empty()) {
    param.test_mode = FLAGS_test_mode;
  }
  param.print_param();

  const ctpn::Rpn::RpnMode mode = FLAGS_train ? ctpn::Rpn::TRAIN : ctpn::Rpn::TEST;
  RegionProposalHead<float> head(param, mode);
  // a negative seed asks for a fresh one from the system
  unsigned int seed;
  if (param.rng_seed < 0) {
    boost::random::random_device device;
    seed = device();
  } else {
    seed = static_cast<unsigned int>(param.rng_seed);
  }
  ctpn::RNG rng(seed);
  LOG(INFO) << "rng seed       : " << seed;

  std::vector<std::string> dumps = ctpn::Rpn::get_file_list(rpn_dir, ".rpn");
  LOG(INFO) << "rpn dir is     : " << rpn_dir << " , " << dumps.size() << " dumps";
  LOG(INFO) << "output file is : " << out_file;
  std::ofstream otfile(out_file.c_str());
  CHECK(otfile.is_open()) << "Can not write " << out_file;

  int count = 0, skipped = 0;
  double total_loss = 0;
  for (size_t index = 0; index < dumps.size(); index++) {
    FeatureMap<float> feature_map;
    ImageInfo<float> im_info;
    std::vector<GtBox<float> > gt_boxes;
    if (!ctpn::Rpn::load_rpn_dump(dumps[index], FLAGS_train, feature_map, im_info, gt_boxes)) {
      skipped++;
      continue;
    }
    RpnOutput<float> output = FLAGS_train ? head.Forward(feature_map, im_info, gt_boxes, &rng)
                                          : head.Forward(feature_map, im_info);
    const std::vector<Proposal<float> >& rois = output.rois;

    const std::string name = boost::filesystem::path(dumps[index]).stem().string();
    otfile << "# " << count << std::endl;
    otfile << name << std::endl;
    otfile << rois.size() << std::endl;
    for (size_t obj = 0; obj < rois.size(); obj++) {
      otfile << rois[obj].anchor_index << "  " << INT(rois[obj][0]) << " " << INT(rois[obj][1]) << " "
             << INT(rois[obj][2]) << " " << INT(rois[obj][3]) << "     " << FloatToString(rois[obj].score) << std::endl;
    }
    ++count;
    if (output.has_losses) {
      total_loss += output.losses.total_loss;
      LOG_EVERY_N(INFO, 100) << "Handle " << count << " th dump : " << name
                             << " , rpn_cross_entropy " << output.losses.rpn_cross_entropy
                             << " , rpn_loss_box " << output.losses.rpn_loss_box
                             << " , mean total_loss " << total_loss / count;
    } else {
      LOG_EVERY_N(INFO, 100) << "Handle " << count << " th dump : " << name << " , Left " << rois.size() << " proposals";
    }
  }
  otfile.close();
  LOG(INFO) << "Done, " << count << " dumps handled , " << skipped << " skipped";
  return skipped == 0 ? 0 : 1;
}
