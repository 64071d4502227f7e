#include <ciftiaxes/axes/parcels.h>
#include <ciftiaxes/errors.h>

#include <gtest/gtest.h>

using namespace ciftiaxes;
using namespace ciftiaxes::axes;

static Eigen::Matrix4d makeAffine()
{
  Eigen::Matrix4d affine = Eigen::Matrix4d::Identity();
  affine.topLeftCorner<3, 3>() *= 2.0;
  affine.topRightCorner<3, 1>() << -90.0, -126.0, -72.0;
  return affine;
}

static const VolumeGeometry GEOMETRY{ makeAffine(), Eigen::Vector3i(91, 109, 91) };

static Parcels makeParcels()
{
  return Parcels({ "motor", "visual", "deep" },
                 { {}, {}, { { 1, 2, 3 }, { 4, 5, 6 } } },
                 { { { "CortexLeft", { 0, 1, 2 } } },
                   { { "CortexLeft", { 5 } }, { "CortexRight", { 4, 8 } } },
                   {} },
                 GEOMETRY, { { "CortexLeft", 10 }, { "CortexRight", 12 } });
}

TEST(Parcels, Construct)
{
  Parcels parcels = makeParcels();

  EXPECT_EQ(3u, parcels.size());
  EXPECT_EQ(2u, parcels.nvertices().size());
  EXPECT_EQ(12, parcels.nvertices().at("CIFTI_STRUCTURE_CORTEX_RIGHT"));

  // structure names are canonicalized
  ASSERT_EQ(1u, parcels.vertices()[0].size());
  EXPECT_EQ((std::vector<int>{ 0, 1, 2 }), parcels.vertices()[0].at("CIFTI_STRUCTURE_CORTEX_LEFT"));
  EXPECT_TRUE(parcels.affine().has_value());
  EXPECT_EQ(Eigen::Vector3i(91, 109, 91), *parcels.volumeShape());
}

TEST(Parcels, ConstructorErrors)
{
  EXPECT_THROW(Parcels({ "a", "b" }, { {} }, { {}, {} }), ShapeMismatch);
  EXPECT_THROW(Parcels({ "a" }, { {} }, { {}, {} }), ShapeMismatch);

  // vertices of a structure without vertex count
  EXPECT_THROW(Parcels({ "a" }, { {} }, { { { "CortexLeft", { 1 } } } }, {}, { { "CortexRight", 5 } }),
               InconsistentVertexCount);

  EXPECT_THROW(Parcels({ "a" }, { {} }, { { { "CortexMiddle", { 1 } } } }, {}, { { "CortexLeft", 5 } }),
               InvalidStructureName);

  EXPECT_THROW(Parcels({ "a" }, { {} }, { { { "CortexLeft", { -1 } } } }, {}, { { "CortexLeft", 5 } }),
               UndefinedIndices);
  EXPECT_THROW(Parcels({ "a" }, { { { 1, -1, 1 } } }, { {} }, GEOMETRY), UndefinedIndices);

  // voxels without a volume
  EXPECT_THROW(Parcels({ "a" }, { { { 1, 1, 1 } } }, { {} }), IncompatibleGeometry);
}

TEST(Parcels, PrunesUnusedState)
{
  Parcels parcels({ "a" }, { {} }, { { { "CortexLeft", { 1 } } } }, GEOMETRY,
                  { { "CortexLeft", 5 }, { "CortexRight", 6 } });

  EXPECT_EQ(1u, parcels.nvertices().size());
  EXPECT_TRUE(parcels.geometry().empty());
}

TEST(Parcels, Element)
{
  Parcels parcels = makeParcels();

  ParcelElement visual = parcels.element(1);
  EXPECT_EQ("visual", visual.name);
  EXPECT_TRUE(visual.voxels.empty());
  EXPECT_EQ((std::vector<int>{ 4, 8 }), visual.vertices.at("CIFTI_STRUCTURE_CORTEX_RIGHT"));

  EXPECT_EQ(2u, parcels.element(-1).voxels.size());
  EXPECT_THROW(parcels.element(3), IndexOutOfRange);
}

TEST(Parcels, Find)
{
  Parcels parcels = makeParcels();

  ParcelElement deep = parcels.find("deep");
  EXPECT_EQ("deep", deep.name);
  EXPECT_EQ(Eigen::Vector3i(4, 5, 6), deep.voxels[1]);

  EXPECT_THROW(parcels.find("auditory"), ParcelNotFound);

  Parcels twice = parcels.concat(parcels.slice(ByRange{ 0, 1 }));
  EXPECT_THROW(twice.find("motor"), AmbiguousParcelName);
  EXPECT_EQ("visual", twice.find("visual").name);
}

TEST(Parcels, SliceTake)
{
  Parcels parcels = makeParcels();
  EXPECT_EQ(parcels, parcels.slice(ByRange{}));

  Parcels surface = parcels.slice(ByRange{ std::nullopt, 2 });
  EXPECT_EQ(2u, surface.size());
  EXPECT_TRUE(surface.geometry().empty());
  EXPECT_EQ(2u, surface.nvertices().size());

  Parcels left_only = parcels.take({ 0 });
  EXPECT_EQ(1u, left_only.nvertices().size());
  EXPECT_EQ(1u, left_only.nvertices().count("CIFTI_STRUCTURE_CORTEX_LEFT"));

  Parcels deep = parcels.take({ 2 });
  EXPECT_TRUE(deep.nvertices().empty());
  EXPECT_TRUE(deep.affine().has_value());
}

TEST(Parcels, Concat)
{
  Parcels parcels = makeParcels();
  Parcels doubled = parcels.concat(parcels);
  EXPECT_EQ(6u, doubled.size());
  EXPECT_EQ("deep", doubled.name()[5]);

  Parcels other_space({ "x" }, { { { 0, 0, 0 } } }, { {} },
                      VolumeGeometry{ Eigen::Matrix4d::Identity(), Eigen::Vector3i(91, 109, 91) });
  EXPECT_THROW(parcels.concat(other_space), IncompatibleGeometry);

  Parcels other_count({ "y" }, { {} }, { { { "CortexLeft", { 1 } } } }, {}, { { "CortexLeft", 11 } });
  EXPECT_THROW(parcels.concat(other_count), InconsistentVertexCount);

  // an axis without voxels adopts the volume of the other
  EXPECT_TRUE(parcels.take({ 0 }).concat(other_space).affine()->isIdentity());
}

TEST(Parcels, Equality)
{
  Parcels parcels = makeParcels();
  EXPECT_EQ(parcels, makeParcels());

  Parcels same({ "motor" }, { {} }, { { { "CortexLeft", { 0, 1, 2 } } } }, {}, { { "CortexLeft", 10 } });
  EXPECT_EQ(parcels.take({ 0 }), same);

  Parcels other_vertices({ "motor" }, { {} }, { { { "CortexLeft", { 0, 1 } } } }, {}, { { "CortexLeft", 10 } });
  EXPECT_NE(parcels.take({ 0 }), other_vertices);

  Parcels other_name({ "premotor" }, { {} }, { { { "CortexLeft", { 0, 1, 2 } } } }, {}, { { "CortexLeft", 10 } });
  EXPECT_NE(parcels.take({ 0 }), other_name);

  Parcels other_structure({ "motor" }, { {} }, { { { "CortexRight", { 0, 1, 2 } } } }, {},
                          { { "CortexRight", 10 } });
  EXPECT_NE(parcels.take({ 0 }), other_structure);

  EXPECT_NE(parcels.take({ 2 }), parcels.take({ 2 }).concat(parcels.take({ 2 })));
}

TEST(Parcels, FromBrainModels)
{
  BrainModel cortex = BrainModel::fromSurface({ 0, 1 }, 10, "CortexLeft");
  BrainModel thalamus =
      BrainModel::fromVoxels({ { 1, 1, 1 } }, GEOMETRY.affine.value(), { 91, 109, 91 }, "thalamus_left");
  BrainModel right = BrainModel::fromSurface({ 3 }, 12, "CortexRight");

  BrainModel mixed = cortex.concat(thalamus).concat(cortex);
  Parcels parcels = Parcels::fromBrainModels({ { "mixed", mixed }, { "right", right } });

  ASSERT_EQ(2u, parcels.size());
  EXPECT_EQ("mixed", parcels.name()[0]);
  ASSERT_EQ(1u, parcels.voxels()[0].size());
  EXPECT_EQ(Eigen::Vector3i(1, 1, 1), parcels.voxels()[0][0]);
  EXPECT_EQ((std::vector<int>{ 0, 1, 0, 1 }), parcels.vertices()[0].at("CIFTI_STRUCTURE_CORTEX_LEFT"));
  EXPECT_EQ((std::vector<int>{ 3 }), parcels.vertices()[1].at("CIFTI_STRUCTURE_CORTEX_RIGHT"));
  EXPECT_EQ(10, parcels.nvertices().at("CIFTI_STRUCTURE_CORTEX_LEFT"));
  EXPECT_EQ(12, parcels.nvertices().at("CIFTI_STRUCTURE_CORTEX_RIGHT"));
  EXPECT_TRUE(parcels.affine()->isApprox(GEOMETRY.affine.value()));

  BrainModel elsewhere =
      BrainModel::fromVoxels({ { 1, 1, 1 } }, Eigen::Matrix4d::Identity(), { 91, 109, 91 }, "thalamus_left");
  EXPECT_THROW(Parcels::fromBrainModels({ { "a", thalamus }, { "b", elsewhere } }), IncompatibleGeometry);

  BrainModel recount = BrainModel::fromSurface({ 0 }, 11, "CortexLeft");
  EXPECT_THROW(Parcels::fromBrainModels({ { "a", cortex }, { "b", recount } }), InconsistentVertexCount);
}

TEST(Parcels, Mapping)
{
  Parcels parcels = makeParcels();
  mapping::MatrixIndicesMap mim = parcels.toMapping(0);

  EXPECT_EQ(mapping::IndexType::Parcels, mim.indices_map_to_data_type);
  ASSERT_EQ(2u, mim.surfaces.size());
  EXPECT_EQ("CIFTI_STRUCTURE_CORTEX_LEFT", mim.surfaces[0].brain_structure);
  EXPECT_EQ(10, mim.surfaces[0].surface_number_of_vertices);
  ASSERT_TRUE(mim.volume.has_value());
  EXPECT_EQ(-3, mim.volume->meter_exponent);

  ASSERT_EQ(3u, mim.parcels.size());
  EXPECT_EQ("visual", mim.parcels[1].name);
  EXPECT_EQ(2u, mim.parcels[1].vertices.size());
  EXPECT_TRUE(mim.parcels[1].voxel_indices_ijk.empty());
  EXPECT_EQ(2u, mim.parcels[2].voxel_indices_ijk.size());

  EXPECT_EQ(parcels, Parcels::fromMapping(mim));

  mapping::MatrixIndicesMap no_surface = mim;
  no_surface.surfaces.pop_back();
  EXPECT_THROW(Parcels::fromMapping(no_surface), InconsistentVertexCount);

  mapping::MatrixIndicesMap no_volume = mim;
  no_volume.volume.reset();
  EXPECT_THROW(Parcels::fromMapping(no_volume), IncompatibleGeometry);
}
