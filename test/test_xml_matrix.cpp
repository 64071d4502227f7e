#include <ciftiaxes/header.h>
#include <ciftiaxes/xml/matrix_parser.h>
#include <ciftiaxes/xml/matrix_writer.h>
#include <ciftiaxes/xml/utils.h>

#include <gtest/gtest.h>

using namespace ciftiaxes;
using namespace ciftiaxes::axes;

static const std::string DENSE_SERIES_XML = R"(
<CIFTI Version="2">
  <Matrix>
    <MetaData>
      <MD><Name>source</Name><Value>unit test</Value></MD>
    </MetaData>
    <MatrixIndicesMap AppliesToMatrixDimension="0" IndicesMapToDataType="CIFTI_INDEX_TYPE_SERIES"
                      NumberOfSeriesPoints="4" SeriesExponent="-3" SeriesStart="0" SeriesStep="720"
                      SeriesUnit="SECOND"/>
    <MatrixIndicesMap AppliesToMatrixDimension="1" IndicesMapToDataType="CIFTI_INDEX_TYPE_BRAIN_MODELS">
      <Volume VolumeDimensions="91,109,91">
        <TransformationMatrixVoxelIndicesIJKtoXYZ MeterExponent="-3">
          -2 0 0 90
          0 2 0 -126
          0 0 2 -72
          0 0 0 1
        </TransformationMatrixVoxelIndicesIJKtoXYZ>
      </Volume>
      <BrainModel IndexOffset="0" IndexCount="3" ModelType="CIFTI_MODEL_TYPE_SURFACE"
                  BrainStructure="CIFTI_STRUCTURE_CORTEX_LEFT" SurfaceNumberOfVertices="32492">
        <VertexIndices>0 1 5</VertexIndices>
      </BrainModel>
      <BrainModel IndexOffset="3" IndexCount="2" ModelType="CIFTI_MODEL_TYPE_VOXELS"
                  BrainStructure="CIFTI_STRUCTURE_THALAMUS_LEFT">
        <VoxelIndicesIJK>
          10 20 30
          11 20 30
        </VoxelIndicesIJK>
      </BrainModel>
    </MatrixIndicesMap>
  </Matrix>
</CIFTI>)";

static std::string withMap(const std::string& map_xml)
{
  return "<Matrix>" + map_xml + "</Matrix>";
}

TEST(XMLMatrix, ParseDenseSeries)
{
  mapping::Matrix matrix;
  ASSERT_TRUE(xml::loadMatrixFromText(DENSE_SERIES_XML, matrix));

  ASSERT_EQ(1u, matrix.metadata.size());
  EXPECT_EQ("source", matrix.metadata[0].first);
  EXPECT_EQ("unit test", matrix.metadata[0].second);
  ASSERT_EQ(2u, matrix.maps.size());

  std::vector<AxisPtr> axes = axesFromMatrix(matrix);
  ASSERT_EQ(2u, axes.size());

  const Series& series = std::get<Series>(*axes[0]);
  EXPECT_EQ(4u, series.size());
  EXPECT_NEAR(0.72, series.step(), 1e-12);
  EXPECT_EQ(SeriesUnit::Second, series.unit());

  const BrainModel& bm = std::get<BrainModel>(*axes[1]);
  ASSERT_EQ(5u, bm.size());
  EXPECT_EQ((std::vector<int>{ 0, 1, 5, -1, -1 }), bm.vertex());
  EXPECT_EQ(Eigen::Vector3i(11, 20, 30), bm.voxel()[4]);
  EXPECT_EQ(32492, bm.nvertices().at("CIFTI_STRUCTURE_CORTEX_LEFT"));
  EXPECT_EQ(Eigen::Vector3i(91, 109, 91), *bm.volumeShape());
  EXPECT_EQ(-2.0, (*bm.affine())(0, 0));
  EXPECT_EQ(-126.0, (*bm.affine())(1, 3));
  EXPECT_EQ(1.0, (*bm.affine())(3, 3));
}

TEST(XMLMatrix, ParseParcelsAndLabels)
{
  const std::string text = R"(
<CIFTI Version="2">
  <Matrix>
    <MatrixIndicesMap AppliesToMatrixDimension="0" IndicesMapToDataType="CIFTI_INDEX_TYPE_LABELS">
      <NamedMap>
        <MapName>atlas</MapName>
        <MetaData><MD><Name>author</Name><Value>someone</Value></MD></MetaData>
        <LabelTable>
          <Label Key="0" Red="0" Green="0" Blue="0" Alpha="0">???</Label>
          <Label Key="7" Red="1" Green="0.5" Blue="0.25" Alpha="1">motor</Label>
        </LabelTable>
      </NamedMap>
    </MatrixIndicesMap>
    <MatrixIndicesMap AppliesToMatrixDimension="1,2" IndicesMapToDataType="CIFTI_INDEX_TYPE_PARCELS">
      <Surface BrainStructure="CIFTI_STRUCTURE_CORTEX_LEFT" SurfaceNumberOfVertices="10"/>
      <Parcel Name="motor">
        <Vertices BrainStructure="CIFTI_STRUCTURE_CORTEX_LEFT">1 2 3</Vertices>
      </Parcel>
      <Parcel Name="empty"/>
    </MatrixIndicesMap>
  </Matrix>
</CIFTI>)";

  mapping::Matrix matrix;
  ASSERT_TRUE(xml::loadMatrixFromText(text, matrix));

  std::vector<AxisPtr> axes = axesFromMatrix(matrix);
  ASSERT_EQ(3u, axes.size());
  EXPECT_EQ(axes[1].get(), axes[2].get());

  const Label& label = std::get<Label>(*axes[0]);
  EXPECT_EQ("atlas", label.name()[0]);
  EXPECT_EQ("someone", label.meta()[0].at("author"));
  EXPECT_EQ("motor", label.label()[0].at(7).name);
  EXPECT_EQ(Eigen::Vector4d(1, 0.5, 0.25, 1), label.label()[0].at(7).rgba);

  const Parcels& parcels = std::get<Parcels>(*axes[1]);
  ASSERT_EQ(2u, parcels.size());
  EXPECT_EQ((std::vector<int>{ 1, 2, 3 }), parcels.find("motor").vertices.at("CIFTI_STRUCTURE_CORTEX_LEFT"));
  EXPECT_TRUE(parcels.find("empty").vertices.empty());
  EXPECT_TRUE(parcels.geometry().empty());
}

TEST(XMLMatrix, BareMatrixRoot)
{
  mapping::Matrix matrix;
  ASSERT_TRUE(xml::loadMatrixFromText(
      withMap(R"(<MatrixIndicesMap AppliesToMatrixDimension="0" IndicesMapToDataType="CIFTI_INDEX_TYPE_SCALARS">
                   <NamedMap><MapName>thickness</MapName></NamedMap>
                 </MatrixIndicesMap>)"),
      matrix));

  std::vector<AxisPtr> axes = axesFromMatrix(matrix);
  ASSERT_EQ(1u, axes.size());
  EXPECT_TRUE(equals(Scalar({ "thickness" }), *axes[0]));
}

TEST(XMLMatrix, MalformedDocument)
{
  mapping::Matrix matrix;
  EXPECT_FALSE(xml::loadMatrixFromText("<CIFTI><Matrix></CIFTI>", matrix));
  EXPECT_FALSE(xml::loadMatrixFromText("", matrix));
  EXPECT_FALSE(xml::loadMatrixFromText("<CIFTI Version=\"2\"/>", matrix));
}

TEST(XMLMatrix, InvalidContent)
{
  mapping::Matrix matrix;

  // missing IndicesMapToDataType
  EXPECT_THROW(xml::loadMatrixFromText(withMap(R"(<MatrixIndicesMap AppliesToMatrixDimension="0"/>)"), matrix),
               std::runtime_error);

  // unknown data type
  EXPECT_THROW(xml::loadMatrixFromText(withMap(R"(<MatrixIndicesMap AppliesToMatrixDimension="0"
                                                   IndicesMapToDataType="CIFTI_INDEX_TYPE_TIME_POINTS"/>)"),
                                       matrix),
               std::runtime_error);

  // unexpected child element
  EXPECT_THROW(xml::loadMatrixFromText(withMap(R"(<MatrixIndicesMap AppliesToMatrixDimension="0"
                                                   IndicesMapToDataType="CIFTI_INDEX_TYPE_SCALARS">
                                                   <Frame/>
                                                 </MatrixIndicesMap>)"),
                                       matrix),
               std::runtime_error);

  // voxel indices not in triplets
  EXPECT_THROW(xml::loadMatrixFromText(withMap(R"(<MatrixIndicesMap AppliesToMatrixDimension="0"
                                                   IndicesMapToDataType="CIFTI_INDEX_TYPE_PARCELS">
                                                   <Parcel Name="p"><VoxelIndicesIJK>1 2</VoxelIndicesIJK></Parcel>
                                                 </MatrixIndicesMap>)"),
                                       matrix),
               std::runtime_error);

  // malformed number
  EXPECT_THROW(xml::loadMatrixFromText(withMap(R"(<MatrixIndicesMap AppliesToMatrixDimension="0"
                                                   IndicesMapToDataType="CIFTI_INDEX_TYPE_SERIES"
                                                   NumberOfSeriesPoints="many"/>)"),
                                       matrix),
               std::runtime_error);

  // dimension list with a value out of int range
  EXPECT_THROW(xml::loadMatrixFromText(withMap(R"(<MatrixIndicesMap AppliesToMatrixDimension="0,99999999999"
                                                   IndicesMapToDataType="CIFTI_INDEX_TYPE_SCALARS"/>)"),
                                       matrix),
               std::runtime_error);

  // two maps for the same dimension
  const std::string scalars = R"(<MatrixIndicesMap AppliesToMatrixDimension="0"
                                                   IndicesMapToDataType="CIFTI_INDEX_TYPE_SCALARS"/>)";
  EXPECT_THROW(xml::loadMatrixFromText(withMap(scalars + scalars), matrix), std::runtime_error);
}

TEST(XMLUtils, NumberLists)
{
  EXPECT_EQ((std::vector<int>{ 1, 2, 3 }), xml::parseIntList("1, 2\n3 ", nullptr));
  EXPECT_EQ((std::vector<int>{ -4 }), xml::parseIntList("  -4", nullptr));
  EXPECT_TRUE(xml::parseIntList("", nullptr).empty());
  EXPECT_TRUE(xml::parseIntList(" \t\n", nullptr).empty());
  EXPECT_TRUE(xml::parseIntList(nullptr, nullptr).empty());

  EXPECT_THROW(xml::parseIntList("0 99999999999", nullptr), std::runtime_error);
  EXPECT_THROW(xml::parseIntList("99999999999 0", nullptr), std::runtime_error);
  EXPECT_THROW(xml::parseIntList("1.5", nullptr), std::runtime_error);
  EXPECT_THROW(xml::parseIntList("1abc", nullptr), std::runtime_error);

  std::vector<double> values = xml::parseDoubleList("0.5,-2e-3 10", nullptr);
  ASSERT_EQ(3u, values.size());
  EXPECT_DOUBLE_EQ(0.5, values[0]);
  EXPECT_DOUBLE_EQ(-2e-3, values[1]);
  EXPECT_DOUBLE_EQ(10.0, values[2]);
}

TEST(XMLMatrix, RoundTrip)
{
  Eigen::Matrix4d affine;
  affine << 0.1, 0.0, 0.0, -90.3, 0.0, 1.0 / 3.0, 0.0, -126.7, 0.0, 0.0, 2.0, -72.0, 0.0, 0.0, 0.0, 1.0;

  BrainModel bm = BrainModel::fromSurface({ 0, 4, 9 }, 10, "CortexRight")
                      .concat(BrainModel::fromVoxels({ { 1, 2, 3 }, { 3, 2, 1 } }, affine, { 5, 6, 7 }, "Cerebellum"));

  LabelTable table;
  table[0] = { "???", Eigen::Vector4d(0, 0, 0, 0) };
  table[5] = { "cerebellum", Eigen::Vector4d(0.1, 0.2, 0.3, 0.4) };

  Parcels parcels = Parcels::fromBrainModels({ { "right", bm.slice(ByRange{ std::nullopt, 3 }) }, { "all", bm } });

  std::vector<AxisPtr> axes = {
    makeAxis(bm),
    makeAxis(Series(0.1, 1.0 / 3.0, 20, SeriesUnit::Meter)),
    makeAxis(Scalar({ "a", "" }, { Meta{ { "key", "value with <markup> & stuff" } }, Meta{} }).toLabel(table)),
    makeAxis(parcels),
    makeAxis(Scalar({ "x" })),
  };
  axes.push_back(axes[0]);

  mapping::Matrix matrix = assembleHeader(axes);
  matrix.metadata.emplace_back("Provenance", "round trip");

  const std::string text = xml::saveMatrixToText(matrix);
  EXPECT_NE(std::string::npos, text.find("<CIFTI Version=\"2\">"));

  mapping::Matrix parsed;
  ASSERT_TRUE(xml::loadMatrixFromText(text, parsed));
  EXPECT_EQ(matrix.metadata, parsed.metadata);

  std::vector<AxisPtr> read = axesFromMatrix(parsed);
  ASSERT_EQ(axes.size(), read.size());
  for (std::size_t i = 0; i < axes.size(); ++i)
    EXPECT_TRUE(equals(*axes[i], *read[i])) << "dimension " << i;

  // doubles are written with enough digits to be read back exactly
  EXPECT_EQ(affine, *std::get<BrainModel>(*read[0]).affine());
  EXPECT_EQ(1.0 / 3.0, std::get<Series>(*read[1]).step());
  EXPECT_EQ(read[0].get(), read[5].get());
}
